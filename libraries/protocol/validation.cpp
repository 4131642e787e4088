#include <bead/protocol/validation.hpp>
#include <bead/protocol/config.hpp>

#include <fc/reflect/variant.hpp>

namespace bead { namespace protocol {

   namespace detail
   {
      template<typename Request>
      validation_rule<Request> make_rule( const string& field,
                                          const string& expected,
                                          const string& suggestion,
                                          typename validation_rule<Request>::predicate_type check,
                                          typename validation_rule<Request>::value_type value )
      {
         validation_rule<Request> r;
         r.field      = field;
         r.expected   = expected;
         r.suggestion = suggestion;
         r.check      = check;
         r.value      = value;
         return r;
      }

      template<typename Request>
      void add_actor_rule( vector<validation_rule<Request>>& rules )
      {
         rules.push_back( make_rule<Request>( "actor", "a non-empty address", "Connect a wallet before submitting",
            []( const Request& r, const validation_context& ) { return !r.actor.empty(); },
            []( const Request& r ) { return variant( r.actor ); } ) );
      }

      template<typename Request>
      void add_game_rules( vector<validation_rule<Request>>& rules )
      {
         rules.push_back( make_rule<Request>( "game.id", "a positive integer not above the maximum game id",
                                              "Verify game ID is within the valid range",
            []( const Request& r, const validation_context& ctx ) {
               return r.game.id >= 1 && r.game.id <= ctx.config.max_game_id;
            },
            []( const Request& r ) { return variant( r.game.id ); } ) );

         rules.push_back( make_rule<Request>( "game.name", "a name within the configured length limits",
                                              "Check the game name length",
            []( const Request& r, const validation_context& ctx ) {
               return r.game.name.size() >= ctx.config.min_game_name_length &&
                      r.game.name.size() <= ctx.config.max_game_name_length;
            },
            []( const Request& r ) { return variant( r.game.name ); } ) );
      }

      template<typename Request>
      void add_contract_rules( vector<validation_rule<Request>>& rules, bool needs_bet_policy, bool needs_oracle_policy )
      {
         if( needs_bet_policy )
            rules.push_back( make_rule<Request>( "contracts.bet_policy_id", "the bet minting policy id of the game",
                                                 "Derive the bet policy id for this game before submitting",
               []( const Request& r, const validation_context& ) { return !r.contracts.bet_policy_id.empty(); },
               []( const Request& r ) { return variant( r.contracts.bet_policy_id ); } ) );

         if( needs_oracle_policy )
            rules.push_back( make_rule<Request>( "contracts.oracle_policy_id", "the oracle minting policy id of the game",
                                                 "Derive the oracle policy id for this game before submitting",
               []( const Request& r, const validation_context& ) { return !r.contracts.oracle_policy_id.empty(); },
               []( const Request& r ) { return variant( r.contracts.oracle_policy_id ); } ) );

         rules.push_back( make_rule<Request>( "contracts.pot_address", "the pot address of the game",
                                              "Ensure you're connected to the correct network",
            []( const Request& r, const validation_context& ) { return !r.contracts.pot_address.empty(); },
            []( const Request& r ) { return variant( r.contracts.pot_address ); } ) );
      }

      vector<validation_rule<place_bet_request>> place_bet_rules()
      {
         typedef place_bet_request R;
         vector<validation_rule<R>> rules;
         add_actor_rule( rules );
         add_game_rules( rules );

         rules.push_back( make_rule<R>( "outcome", "0 (Draw), 1 (Home Win) or 2 (Away Win)",
                                        "Choose one of the three outcomes",
            []( const R& r, const validation_context& ) { return is_defined_outcome( r.outcome ); },
            []( const R& r ) { return variant( int64_t( r.outcome ) ); } ) );

         rules.push_back( make_rule<R>( "stake", "a non-negative amount of lovelace", "Enter a positive bet amount",
            []( const R& r, const validation_context& ) { return r.stake >= 0; },
            []( const R& r ) { return variant( r.stake ); } ) );

         rules.push_back( make_rule<R>( "bead_stake", "a non-negative amount of BEAD", "Enter a positive BEAD amount",
            []( const R& r, const validation_context& ) { return r.bead_stake >= 0; },
            []( const R& r ) { return variant( r.bead_stake ); } ) );

         rules.push_back( make_rule<R>( "stake", "a non-zero stake in lovelace or BEAD", "Enter a bet amount",
            []( const R& r, const validation_context& ) { return r.stake > 0 || r.bead_stake > 0; },
            []( const R& r ) { return variant( r.stake ); } ) );

         rules.push_back( make_rule<R>( "stake", "zero or between the minimum and maximum bet", "Adjust the bet amount",
            []( const R& r, const validation_context& ctx ) {
               return r.stake == 0 || ( r.stake >= ctx.config.min_bet_stake && r.stake <= ctx.config.max_bet_stake );
            },
            []( const R& r ) { return variant( r.stake ); } ) );

         rules.push_back( make_rule<R>( "bead_stake", "at most the maximum BEAD bet", "Reduce the BEAD amount",
            []( const R& r, const validation_context& ctx ) { return r.bead_stake <= ctx.config.max_bead_stake; },
            []( const R& r ) { return variant( r.bead_stake ); } ) );

         rules.push_back( make_rule<R>( "game.start_time", "a time in the future", "Bets close when the game starts",
            []( const R& r, const validation_context& ctx ) { return r.game.start_time > ctx.now; },
            []( const R& r ) { return variant( r.game.start_time ); } ) );

         rules.push_back( make_rule<R>( "game.start_time", "a time within the maximum betting horizon",
                                        "Check the game date",
            []( const R& r, const validation_context& ctx ) {
               return r.game.start_time <= ctx.now + ctx.config.max_game_horizon_sec;
            },
            []( const R& r ) { return variant( r.game.start_time ); } ) );

         add_contract_rules( rules, true, false );
         return rules;
      }

      vector<validation_rule<purchase_token_request>> purchase_token_rules()
      {
         typedef purchase_token_request R;
         vector<validation_rule<R>> rules;
         add_actor_rule( rules );

         rules.push_back( make_rule<R>( "contribution", "a positive amount of lovelace", "Enter a positive amount",
            []( const R& r, const validation_context& ) { return r.contribution > 0; },
            []( const R& r ) { return variant( r.contribution ); } ) );

         rules.push_back( make_rule<R>( "contribution", "at least the lowest purchase tier",
                                        "Increase the contribution to the lowest purchase tier",
            []( const R& r, const validation_context& ctx ) { return ctx.config.tier_for( r.contribution ).valid(); },
            []( const R& r ) { return variant( r.contribution ); } ) );

         rules.push_back( make_rule<R>( "referrer", "a non-empty address when present",
                                        "Verify the referral address format",
            []( const R& r, const validation_context& ) { return !r.referrer.valid() || !r.referrer->empty(); },
            []( const R& r ) { return variant( r.referrer ); } ) );

         rules.push_back( make_rule<R>( "referrer", "an address other than the buyer", "Use someone else's referral address",
            []( const R& r, const validation_context& ) { return !r.referrer.valid() || *r.referrer != r.actor; },
            []( const R& r ) { return variant( r.referrer ); } ) );

         return rules;
      }

      vector<validation_rule<redeem_bet_request>> redeem_bet_rules()
      {
         typedef redeem_bet_request R;
         vector<validation_rule<R>> rules;
         add_actor_rule( rules );
         add_game_rules( rules );

         rules.push_back( make_rule<R>( "outcome", "0 (Draw), 1 (Home Win) or 2 (Away Win)",
                                        "Redeem the outcome your bet tokens were minted for",
            []( const R& r, const validation_context& ) { return is_defined_outcome( r.outcome ); },
            []( const R& r ) { return variant( int64_t( r.outcome ) ); } ) );

         add_contract_rules( rules, true, true );
         return rules;
      }

      vector<validation_rule<publish_game_result_request>> publish_game_result_rules()
      {
         typedef publish_game_result_request R;
         vector<validation_rule<R>> rules;
         add_actor_rule( rules );
         add_game_rules( rules );

         rules.push_back( make_rule<R>( "winner", "0 (Draw), 1 (Home Win) or 2 (Away Win)",
                                        "Result must be 0 (Draw), 1 (Home Win), or 2 (Away Win)",
            []( const R& r, const validation_context& ) { return is_defined_outcome( r.winner ); },
            []( const R& r ) { return variant( int64_t( r.winner ) ); } ) );

         rules.push_back( make_rule<R>( "result_label", "a non-empty final score within the length limit",
                                        "Verify goals string is not empty and properly formatted",
            []( const R& r, const validation_context& ctx ) {
               return !r.result_label.empty() && r.result_label.size() <= ctx.config.max_result_label_length;
            },
            []( const R& r ) { return variant( r.result_label ); } ) );

         rules.push_back( make_rule<R>( "game.start_time", "a time that has already passed",
                                        "Publish the result once the game has been played",
            []( const R& r, const validation_context& ctx ) { return r.game.start_time <= ctx.now; },
            []( const R& r ) { return variant( r.game.start_time ); } ) );

         add_contract_rules( rules, true, true );
         return rules;
      }

      vector<validation_rule<collect_treasury_request>> collect_treasury_rules()
      {
         typedef collect_treasury_request R;
         vector<validation_rule<R>> rules;
         add_actor_rule( rules );

         rules.push_back( make_rule<R>( "actor", "the treasury address", "Only the treasury may collect a pot",
            []( const R& r, const validation_context& ctx ) { return r.actor == ctx.config.treasury_address; },
            []( const R& r ) { return variant( r.actor ); } ) );

         rules.push_back( make_rule<R>( "game.id", "a positive integer not above the maximum game id",
                                        "Verify game ID is within the valid range",
            []( const R& r, const validation_context& ctx ) {
               return r.game.id >= 1 && r.game.id <= ctx.config.max_game_id;
            },
            []( const R& r ) { return variant( r.game.id ); } ) );

         add_contract_rules( rules, false, true );
         return rules;
      }
   }

   result<place_bet_request> validate( const place_bet_request& request,
                                       const protocol_config& config,
                                       const time_point_sec& now )
   {
      static const auto rules = detail::place_bet_rules();
      return apply_rules( rules, request, validation_context( config, now ) );
   }

   result<purchase_token_request> validate( const purchase_token_request& request,
                                            const protocol_config& config,
                                            const time_point_sec& now )
   {
      static const auto rules = detail::purchase_token_rules();
      return apply_rules( rules, request, validation_context( config, now ) );
   }

   result<redeem_bet_request> validate( const redeem_bet_request& request,
                                        const protocol_config& config,
                                        const time_point_sec& now )
   {
      static const auto rules = detail::redeem_bet_rules();
      return apply_rules( rules, request, validation_context( config, now ) );
   }

   result<publish_game_result_request> validate( const publish_game_result_request& request,
                                                 const protocol_config& config,
                                                 const time_point_sec& now )
   {
      static const auto rules = detail::publish_game_result_rules();
      return apply_rules( rules, request, validation_context( config, now ) );
   }

   result<collect_treasury_request> validate( const collect_treasury_request& request,
                                              const protocol_config& config,
                                              const time_point_sec& now )
   {
      static const auto rules = detail::collect_treasury_rules();
      return apply_rules( rules, request, validation_context( config, now ) );
   }

} } // bead::protocol
