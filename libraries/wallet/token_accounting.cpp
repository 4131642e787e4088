#include <bead/wallet/token_accounting.hpp>

#include <bead/protocol/config.hpp>
#include <bead/protocol/exceptions.hpp>

#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/string.hpp>

#include <algorithm>

namespace bead { namespace wallet {

   share_type bet_pot_value( share_type stake, const protocol_config& config )
   {
      return std::max( stake, config.selection.min_output_value );
   }

   uint32_t referral_bonus_bps( const purchase_tier& tier, const protocol_config& config )
   {
      return uint32_t( std::min<share_type>( checked_mul( tier.referral_amount, 100 ),
                                             config.max_referral_percent_bps ) );
   }

   share_type purchase_outlay( const purchase_token_request& request, const protocol_config& config )
   { try {
      auto tier = config.tier_for( request.contribution );
      FC_ASSERT( tier.valid(), "contribution does not reach a purchase tier" );
      if( !request.referrer.valid() )
         return request.contribution;

      share_type referral = mul_div( request.contribution, referral_bonus_bps( *tier, config ), BEAD_PERCENT_BPS );
      return checked_add( checked_sub( request.contribution, referral ),
                          std::max( referral, config.selection.min_output_value ) );
   } FC_CAPTURE_AND_RETHROW( (request) ) }

   result<bet_accounting> account_place_bet( const place_bet_request& request, const protocol_config& config )
   {
      try {
         bet_accounting acct;
         acct.bet_unit    = bet_token_unit( request.contracts.bet_policy_id, request.outcome, request.game.name );
         acct.bet_tokens  = checked_add( request.stake, checked_mul( request.bead_stake, config.bead_scale_factor ) );
         acct.bead_burned = request.bead_stake;
         acct.pot_value   = bet_pot_value( request.stake, config );

         FC_ASSERT( acct.bet_tokens > 0, "a bet must mint at least one token" );

         acct.deltas.push_back( token_delta( acct.bet_unit, acct.bet_tokens ) );
         if( acct.bead_burned > 0 )
            acct.deltas.push_back( token_delta( config.bead_unit(), -acct.bead_burned ) );
         return acct;
      }
      catch( const fc::exception& e )
      {
         return failure_from_exception( accounting_error, "Unable to account for the bet", e );
      }
   }

   result<purchase_accounting> account_purchase( const purchase_token_request& request, const protocol_config& config )
   {
      try {
         auto tier = config.tier_for( request.contribution );
         if( !tier.valid() )
         {
            FC_ASSERT( !config.purchase_tiers.empty() );
            const auto& lowest = config.purchase_tiers.front();
            return failure( invalid_input,
                            "Contribution of " + fc::to_string( request.contribution ) +
                            " lovelace is below the lowest purchase tier",
                            mutable_variant_object( "field", "contribution" )
                                                  ( "value", request.contribution )
                                                  ( "expected", lowest.threshold ),
                            { "Contribute at least " + fc::to_string( lowest.threshold ) + " lovelace" } );
         }

         purchase_accounting acct;
         acct.contribution    = request.contribution;
         acct.tier            = *tier;
         acct.bead_minted     = mul_div( request.contribution, tier->bead_amount, tier->threshold );
         acct.deltas.push_back( token_delta( config.bead_unit(), acct.bead_minted ) );

         if( request.referrer.valid() )
         {
            uint32_t bonus_bps = referral_bonus_bps( *tier, config );
            ada_distribution dist;
            dist.referral_bonus_bps = bonus_bps;
            dist.referral           = mul_div( request.contribution, bonus_bps, BEAD_PERCENT_BPS );
            dist.treasury           = checked_sub( request.contribution, dist.referral );

            acct.distribution       = dist;
            acct.referral_bonus_bps = bonus_bps;
            acct.referral_minted    = mul_div( request.contribution, tier->referral_amount, tier->threshold );
            acct.referrer_output_value = std::max( dist.referral, config.selection.min_output_value );

            if( acct.referral_minted > 0 )
               acct.deltas.push_back( token_delta( config.referral_unit(), acct.referral_minted ) );

            if( dist.referral < config.selection.min_output_value )
            {
               acct.warnings.push_back( "referral bonus below recommended minimum" );
               wlog( "referral share ${r} below minimum output ${m}, buyer tops up the referrer output",
                     ("r", dist.referral)("m", config.selection.min_output_value) );
            }
         }
         return acct;
      }
      catch( const fc::exception& e )
      {
         return failure_from_exception( accounting_error, "Unable to account for the token purchase", e );
      }
   }

   result<redemption_accounting> account_redemption( const asset_unit_type& bet_unit,
                                                     share_type held_tokens,
                                                     const oracle_record& record,
                                                     bool eligible,
                                                     const protocol_config& config )
   {
      try {
         FC_ASSERT( held_tokens > 0, "nothing to redeem" );
         FC_ASSERT( record.total_pool >= 0 && record.total_winnings >= 0 );

         redemption_accounting acct;
         acct.bet_unit    = bet_unit;
         acct.held_tokens = held_tokens;
         acct.eligible    = eligible;
         acct.deltas.push_back( token_delta( bet_unit, -held_tokens ) );

         if( record.total_winnings == 0 )
         {
            acct.refunded = true;
            acct.payout   = held_tokens;
            acct.warnings.push_back( "no winning bets for this game, stakes are refunded at par" );
         }
         else if( eligible )
         {
            if( held_tokens > record.total_winnings )
            {
               return failure( accounting_error,
                               "Held winning tokens exceed the total winnings published by the oracle",
                               mutable_variant_object( "held_tokens", held_tokens )
                                                     ( "total_winnings", record.total_winnings ) );
            }
            acct.payout = mul_div( held_tokens, record.total_pool, record.total_winnings );
         }

         acct.multiplier = double( acct.payout ) / double( held_tokens );

         if( acct.payout > config.max_payout )
         {
            return failure( invalid_input,
                            "Payout of " + fc::to_string( acct.payout ) + " lovelace exceeds the maximum payout",
                            mutable_variant_object( "field", "payout" )
                                                  ( "value", acct.payout )
                                                  ( "expected", config.max_payout ),
                            { "Try redeeming a smaller amount of bet tokens" } );
         }
         if( acct.payout > 0 && acct.payout < config.min_payout )
            acct.warnings.push_back( "payout is below the minimum recommended payout" );

         return acct;
      }
      catch( const fc::exception& e )
      {
         return failure_from_exception( accounting_error, "Unable to account for the redemption", e );
      }
   }

   result<publication_accounting> account_game_result( const publish_game_result_request& request,
                                                       const vector<spendable_output>& pot,
                                                       const time_point_sec& now,
                                                       const protocol_config& config )
   {
      try {
         publication_accounting acct;
         acct.tally[tie_outcome]  = outcome_tally();
         acct.tally[home_outcome] = outcome_tally();
         acct.tally[away_outcome] = outcome_tally();

         share_type pool = 0;
         for( const auto& o : pot )
         {
            if( !o.bet.valid() || o.bet->game_id != request.game.id )
               continue;
            auto& t = acct.tally[o.bet->outcome];
            t.bets    += 1;
            t.tokens   = checked_add( t.tokens, o.bet->bet_tokens );
            t.lovelace = checked_add( t.lovelace, o.native() );
            pool       = checked_add( pool, o.native() );
         }

         acct.record.game_id         = request.game.id;
         acct.record.game_name       = request.game.name;
         acct.record.settled_outcome = request.winner;
         acct.record.bet_policy_id   = request.contracts.bet_policy_id;
         acct.record.total_pool      = pool;
         acct.record.total_winnings  = acct.tally[request.winner].tokens;
         acct.record.result_label    = request.result_label;
         acct.record.published       = now;

         acct.oracle_unit  = oracle_token_unit( request.contracts.oracle_policy_id, request.result_label );
         acct.treasury_fee = mul_div( pool, config.treasury_fee_bps, BEAD_PERCENT_BPS );
         acct.deltas.push_back( token_delta( acct.oracle_unit, 1 ) );

         if( pool == 0 )
            acct.warnings.push_back( "no bets found at the pot for this game" );
         else if( acct.record.total_winnings == 0 )
            acct.warnings.push_back( "nobody bet on the winning outcome, stakes will be refunded" );

         return acct;
      }
      catch( const fc::exception& e )
      {
         return failure_from_exception( accounting_error, "Unable to account for the game result", e );
      }
   }

   namespace detail
   {
      bool holds_policy( const spendable_output& o, const policy_id_type& policy )
      {
         for( const auto& a : o.assets )
            if( a.second > 0 && unit_policy( a.first ) == policy )
               return true;
         return false;
      }
   }

   result<collection_accounting> account_collection( const collect_treasury_request& request,
                                                     const vector<spendable_output>& pot,
                                                     const protocol_config& config )
   {
      try {
         const auto game_id = request.game.id;

         vector<spendable_output> oracle_outputs;
         vector<spendable_output> bet_outputs;
         bool settled = false;
         for( const auto& o : pot )
         {
            if( o.oracle.valid() && o.oracle->game_id == game_id &&
                detail::holds_policy( o, request.contracts.oracle_policy_id ) )
            {
               oracle_outputs.push_back( o );
               settled = settled || o.oracle->is_settled();
            }
            else if( o.bet.valid() && o.bet->game_id == game_id )
               bet_outputs.push_back( o );
         }

         if( oracle_outputs.empty() )
         {
            return failure( game_not_found,
                            "No result has been published for game " + fc::to_string( game_id ),
                            mutable_variant_object( "game_id", game_id )
                                                  ( "pot_address", request.contracts.pot_address )
                                                  ( "oracle_policy_id", request.contracts.oracle_policy_id ),
                            { "Publish the game result before collecting the pot" } );
         }
         if( !settled )
         {
            return failure( oracle_not_settled,
                            "The result of game " + fc::to_string( game_id ) + " is not settled yet",
                            mutable_variant_object( "game_id", game_id ),
                            { "Wait for the oracle to settle the game" } );
         }

         collection_accounting acct;
         acct.swept = oracle_outputs;
         acct.swept.insert( acct.swept.end(), bet_outputs.begin(), bet_outputs.end() );
         std::sort( acct.swept.begin(), acct.swept.end(), []( const spendable_output& a, const spendable_output& b ) {
            return a.native() > b.native();
         });
         if( acct.swept.size() > config.selection.max_inputs )
         {
            acct.swept.resize( config.selection.max_inputs );
            acct.warnings.push_back( "pot holds more outputs than one transaction can spend, run the collection again" );
         }
         if( !bet_outputs.empty() )
         {
            acct.warnings.push_back( fc::to_string( uint64_t( bet_outputs.size() ) ) +
                                     " bet outputs were never used for a payout and go to the treasury" );
            wlog( "collecting ${n} unredeemed bet outputs of game ${g}", ("n", bet_outputs.size())("g", game_id) );
         }

         asset_map gathered;
         for( const auto& o : acct.swept )
            add_to( gathered, o.assets );

         for( const auto& item : gathered )
         {
            if( item.second > 0 && unit_policy( item.first ) == request.contracts.oracle_policy_id )
               acct.deltas.push_back( token_delta( item.first, -item.second ) );
         }

         acct.collected = checked_sub( native_amount( gathered ), config.network_fee );
         if( acct.collected < config.selection.min_output_value )
         {
            return failure( insufficient_funds,
                            "The pot does not hold enough to cover the fee and a treasury output",
                            mutable_variant_object( "pot_outputs", uint64_t( acct.swept.size() ) )
                                                  ( "pot_value", native_amount( gathered ) )
                                                  ( "network_fee", config.network_fee ),
                            { "Check if the betting pot has adequate UTXOs" } );
         }
         return acct;
      }
      catch( const fc::exception& e )
      {
         return failure_from_exception( accounting_error, "Unable to account for the treasury collection", e );
      }
   }

} } // bead::wallet
