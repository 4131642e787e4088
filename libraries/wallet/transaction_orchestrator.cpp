#include <bead/wallet/transaction_orchestrator.hpp>
#include <bead/wallet/transaction_builder.hpp>

#include <bead/protocol/config.hpp>
#include <bead/protocol/exceptions.hpp>
#include <bead/protocol/validation.hpp>

#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/string.hpp>

#include <algorithm>

namespace bead { namespace wallet {

   string state_name( orchestrator_state s )
   {
      switch( s )
      {
         case validating_state:       return "validating";
         case selecting_state:        return "selecting";
         case verifying_oracle_state: return "verifying_oracle";
         case accounting_state:       return "accounting";
         case building_state:         return "building";
         case submitted_state:        return "submitted";
         case done_state:             return "done";
         case failed_state:           return "failed";
      }
      return "unknown";
   }

   string operation_name( operation_type_enum op )
   {
      switch( op )
      {
         case place_bet_op_type:           return "place_bet";
         case purchase_token_op_type:      return "purchase_token";
         case redeem_bet_op_type:          return "redeem_bet";
         case publish_game_result_op_type: return "publish_game_result";
         case collect_treasury_op_type:    return "collect_treasury";
      }
      return "unknown";
   }

   namespace detail
   {
      /**
       *  State of one pass through the orchestrator.  Tracks the current stage so that
       *  failures can be tagged with it.
       */
      class orchestration_run
      {
         public:
            explicit orchestration_run( operation_type_enum op )
            :_operation(op),_state(validating_state)
            {
               _transitions.push_back( _state );
            }

            /** Reads the ledger time once; every later step of the run uses it */
            optional<failure> read_clock( ledger_provider& provider )
            {
               auto clock = provider.now();
               if( clock.is_failure() ) return fail( clock.error() );
               _now = *clock;
               dlog( "${op}: validating at ${now}", ("op", operation_name( _operation ))("now", _now) );
               return optional<failure>();
            }

            void enter( orchestrator_state next )
            {
               dlog( "${op}: ${from} -> ${to}",
                     ("op", operation_name( _operation ))("from", state_name( _state ))("to", state_name( next )) );
               _state = next;
               _transitions.push_back( next );
            }

            failure fail( const failure& f )
            {
               auto tagged = f.with_context( "stage", state_name( _state ) )
                              .with_context( "operation", operation_name( _operation ) );
               wlog( "${op} failed while ${stage}: ${f}",
                     ("op", operation_name( _operation ))("stage", state_name( _state ))("f", tagged.to_string()) );
               _state = failed_state;
               _transitions.push_back( failed_state );
               return tagged;
            }

            failure fail( const fc::exception& e )
            {
               return fail( failure_from_exception( code_for( e ), "Unexpected error while " + state_name( _state ), e ) );
            }

            /** Submission problems are always reported as transaction_failed */
            failure fail_submission( const failure& f )
            {
               if( f.code == transaction_failed )
                  return fail( f );
               failure wrapped( transaction_failed, f.message, f.context );
               return fail( wrapped.with_context( "provider_code", failure_code_name( f.code ) ) );
            }

            operation_outcome finish( operation_outcome outcome, const transaction_id_type& id )
            {
               enter( submitted_state );
               outcome.operation      = _operation;
               outcome.transaction_id = id;
               enter( done_state );
               outcome.transitions    = _transitions;
               ilog( "${op} done: ${s} (${id})", ("op", operation_name( _operation ))("s", outcome.summary)("id", id) );
               return outcome;
            }

            const time_point_sec& now()const { return _now; }

         private:
            failure_code code_for( const fc::exception& e )const
            {
               if( e.code() == unbalanced_transaction::code_value || e.code() == burn_exceeds_holdings::code_value )
                  return accounting_error;
               switch( _state )
               {
                  case validating_state: return invalid_input;
                  case building_state:
                  case submitted_state:  return transaction_failed;
                  default:               return accounting_error;
               }
            }

            operation_type_enum          _operation;
            orchestrator_state           _state;
            time_point_sec               _now;
            vector<orchestrator_state>   _transitions;
      };

      vector<spendable_output> resolve( const vector<spendable_output>& snapshot, const vector<output_reference>& ids )
      {
         vector<spendable_output> found;
         for( const auto& id : ids )
         {
            auto itr = std::find_if( snapshot.begin(), snapshot.end(),
                                     [&]( const spendable_output& o ) { return o.id == id; } );
            FC_ASSERT( itr != snapshot.end(), "selected output ${id} is not part of the snapshot", ("id", id) );
            found.push_back( *itr );
         }
         return found;
      }

      /** true when spending outputs and burning burns still leaves tokens for the change output */
      bool leaves_tokens( const vector<spendable_output>& outputs, const vector<token_delta>& burns )
      {
         asset_map remaining;
         for( const auto& o : outputs )
            add_to( remaining, o.assets );
         for( const auto& d : burns )
            if( d.quantity < 0 )
               add_to( remaining, asset( d.quantity, d.unit ) );
         return has_tokens( remaining );
      }

      /** Every delta computed by the accounting step must reach the ledger unchanged */
      optional<failure> check_deltas( const vector<token_delta>& expected, const vector<token_delta>& built )
      {
         for( const auto& d : expected )
         {
            auto itr = std::find_if( built.begin(), built.end(),
                                     [&]( const token_delta& b ) { return b.unit == d.unit; } );
            if( itr == built.end() || itr->quantity != d.quantity )
            {
               return failure( accounting_error, "Transaction token deltas differ from the computed accounting",
                               mutable_variant_object( "unit", d.unit )
                                                     ( "expected", d.quantity )
                                                     ( "built", itr == built.end() ? share_type( 0 ) : itr->quantity ) );
            }
         }
         return optional<failure>();
      }

      void add_selection_warnings( const selection_result& sel, vector<string>& warnings )
      {
         if( sel.dust_skipped > 0 )
            warnings.push_back( fc::to_string( uint64_t( sel.dust_skipped ) ) + " dust outputs skipped" );
      }

      validity_interval make_validity( const optional<time_point_sec>& from, const time_point_sec& to )
      {
         validity_interval v;
         v.valid_from = from;
         v.valid_to   = to;
         return v;
      }

      asset_map lovelace( share_type amount )
      {
         asset_map a;
         a[native_unit()] = amount;
         return a;
      }

      string ada_string( share_type lovelace )
      {
         return fc::to_string( lovelace / BEAD_LOVELACE_PER_ADA ) + "." +
                fc::to_string( lovelace % BEAD_LOVELACE_PER_ADA + BEAD_LOVELACE_PER_ADA ).substr( 1 ) + " ADA";
      }
   }

   result<operation_outcome> place_bet( const place_bet_request& request,
                                        const protocol_config& config,
                                        ledger_provider& provider )
   {
      detail::orchestration_run run( place_bet_op_type );
      try {
         auto clock_failure = run.read_clock( provider );
         if( clock_failure.valid() ) return *clock_failure;

         auto valid = validate( request, config, run.now() );
         if( valid.is_failure() ) return run.fail( valid.error() );

         run.enter( selecting_state );
         auto wallet = provider.get_spendable_outputs( request.actor );
         if( wallet.is_failure() ) return run.fail( wallet.error() );

         selection_request needs;
         if( request.bead_stake > 0 )
         {
            auto bead_inputs = select_token_inputs( *wallet, config.bead_unit(), request.bead_stake, config.selection );
            if( bead_inputs.is_failure() ) return run.fail( bead_inputs.error() );
            needs.preselected     = *bead_inputs;
            needs.change_required = detail::leaves_tokens( needs.preselected,
                                       { token_delta( config.bead_unit(), -request.bead_stake ) } );
         }
         needs.target      = checked_add( bet_pot_value( request.stake, config ), config.selection.min_output_value );
         needs.fee_reserve = config.network_fee;

         auto candidates = without( native_only( *wallet ), needs.preselected );
         auto sel = select_inputs( candidates, needs, config.selection );
         if( sel.is_failure() ) return run.fail( sel.error() );

         run.enter( accounting_state );
         auto acct = account_place_bet( request, config );
         if( acct.is_failure() ) return run.fail( acct.error() );

         run.enter( building_state );
         transaction_builder builder( config );
         builder.spend( detail::resolve( *wallet, sel->inputs ) );
         if( acct->bead_burned > 0 )
            builder.burn( request.actor, config.bead_unit(), acct->bead_burned );
         builder.mint( request.actor, acct->bet_unit, acct->bet_tokens );

         transaction_output pot( request.contracts.pot_address, detail::lovelace( acct->pot_value ) );
         bet_datum datum;
         datum.game_id    = request.game.id;
         datum.outcome    = request.outcome;
         datum.bet_tokens = acct->bet_tokens;
         pot.bet = datum;
         builder.pay( request.actor, pot );

         asset_map receipt = detail::lovelace( config.selection.min_output_value );
         receipt[acct->bet_unit] = acct->bet_tokens;
         builder.pay( request.actor, transaction_output( request.actor, receipt ) );

         auto validity = detail::make_validity( run.now(), request.game.start_time );
         builder.pay_fee( request.actor, config.network_fee )
                .set_validity( validity )
                .require_signature( request.actor )
                .set_memo( "bet " + request.game.name );
         const auto& trx = builder.finalize();

         auto mismatch = detail::check_deltas( acct->deltas, trx.mint );
         if( mismatch.valid() ) return run.fail( *mismatch );

         auto id = provider.submit_transaction( trx );
         if( id.is_failure() ) return run.fail_submission( id.error() );

         operation_outcome outcome;
         outcome.summary = "Bet " + detail::ada_string( request.stake ) +
                           ( request.bead_stake > 0 ? " and " + fc::to_string( request.bead_stake ) + " BEAD" : string() ) +
                           " on " + outcome_description( request.outcome ) + " for " + request.game.name;
         outcome.token_deltas = trx.mint;
         outcome.selection    = *sel;
         outcome.validity     = validity;
         outcome.transaction  = trx;
         outcome.details.bet  = *acct;
         detail::add_selection_warnings( *sel, outcome.warnings );
         return run.finish( outcome, *id );
      }
      catch( const fc::exception& e )
      {
         return run.fail( e );
      }
   }

   result<operation_outcome> purchase_token( const purchase_token_request& request,
                                             const protocol_config& config,
                                             ledger_provider& provider )
   {
      detail::orchestration_run run( purchase_token_op_type );
      try {
         auto clock_failure = run.read_clock( provider );
         if( clock_failure.valid() ) return *clock_failure;

         auto valid = validate( request, config, run.now() );
         if( valid.is_failure() ) return run.fail( valid.error() );

         run.enter( selecting_state );
         auto wallet = provider.get_spendable_outputs( request.actor );
         if( wallet.is_failure() ) return run.fail( wallet.error() );

         selection_request needs;
         needs.target      = checked_add( purchase_outlay( request, config ), config.selection.min_output_value );
         needs.fee_reserve = config.network_fee;

         auto sel = select_inputs( native_only( *wallet ), needs, config.selection );
         if( sel.is_failure() ) return run.fail( sel.error() );

         run.enter( accounting_state );
         auto acct = account_purchase( request, config );
         if( acct.is_failure() ) return run.fail( acct.error() );

         run.enter( building_state );
         transaction_builder builder( config );
         builder.spend( detail::resolve( *wallet, sel->inputs ) )
                .mint( request.actor, config.bead_unit(), acct->bead_minted );

         asset_map bead_output = detail::lovelace( config.selection.min_output_value );
         bead_output[config.bead_unit()] = acct->bead_minted;
         builder.pay( request.actor, transaction_output( request.actor, bead_output ) );

         share_type to_treasury = acct->distribution.valid() ? acct->distribution->treasury : acct->contribution;
         builder.pay( request.actor, transaction_output( config.treasury_address, detail::lovelace( to_treasury ) ) );

         if( request.referrer.valid() )
         {
            asset_map referral_output = detail::lovelace( acct->referrer_output_value );
            if( acct->referral_minted > 0 )
            {
               builder.mint( request.actor, config.referral_unit(), acct->referral_minted );
               referral_output[config.referral_unit()] = acct->referral_minted;
            }
            builder.pay( request.actor, transaction_output( *request.referrer, referral_output ) );
         }

         auto validity = detail::make_validity( run.now(), run.now() + config.transaction_expiration_sec );
         builder.pay_fee( request.actor, config.network_fee )
                .set_validity( validity )
                .require_signature( request.actor )
                .set_memo( "purchase " + config.bead_token_name );
         const auto& trx = builder.finalize();

         auto mismatch = detail::check_deltas( acct->deltas, trx.mint );
         if( mismatch.valid() ) return run.fail( *mismatch );

         auto id = provider.submit_transaction( trx );
         if( id.is_failure() ) return run.fail_submission( id.error() );

         operation_outcome outcome;
         outcome.summary = "Purchased " + fc::to_string( acct->bead_minted ) + " " + config.bead_token_name +
                           " for " + detail::ada_string( request.contribution );
         if( request.referrer.valid() )
            outcome.summary += " referred by " + *request.referrer;
         outcome.token_deltas = trx.mint;
         outcome.selection    = *sel;
         outcome.validity     = validity;
         outcome.transaction  = trx;
         outcome.details.purchase = *acct;
         outcome.warnings     = acct->warnings;
         detail::add_selection_warnings( *sel, outcome.warnings );
         return run.finish( outcome, *id );
      }
      catch( const fc::exception& e )
      {
         return run.fail( e );
      }
   }

   result<operation_outcome> redeem_bet( const redeem_bet_request& request,
                                         const protocol_config& config,
                                         ledger_provider& provider )
   {
      detail::orchestration_run run( redeem_bet_op_type );
      try {
         auto clock_failure = run.read_clock( provider );
         if( clock_failure.valid() ) return *clock_failure;

         auto valid = validate( request, config, run.now() );
         if( valid.is_failure() ) return run.fail( valid.error() );

         run.enter( selecting_state );
         auto wallet = provider.get_spendable_outputs( request.actor );
         if( wallet.is_failure() ) return run.fail( wallet.error() );

         const auto bet_unit = bet_token_unit( request.contracts.bet_policy_id, request.outcome, request.game.name );
         auto bet_outputs = outputs_holding( *wallet, bet_unit );
         share_type held = 0;
         for( const auto& o : bet_outputs )
            held = checked_add( held, o.quantity( bet_unit ) );
         if( held == 0 )
         {
            return run.fail( failure( insufficient_funds,
                                      "No " + unit_name( bet_unit ) + " bet tokens to redeem",
                                      mutable_variant_object( "unit", bet_unit )( "actor", request.actor ),
                                      { "Check that you placed a bet on this outcome", "Check the game id" } ) );
         }

         selection_request needs;
         needs.preselected = bet_outputs;
         vector<token_delta> burns{ token_delta( bet_unit, -held ) };
         if( request.close_oracle )
         {
            for( const auto& o : *wallet )
            {
               bool oracle_tokens = false;
               for( const auto& a : o.assets )
                  if( a.second > 0 && unit_policy( a.first ) == request.contracts.oracle_policy_id )
                  {
                     oracle_tokens = true;
                     burns.push_back( token_delta( a.first, -a.second ) );
                  }
               if( oracle_tokens && !o.quantity( bet_unit ) )
                  needs.preselected.push_back( o );
            }
         }
         needs.target          = 0;
         needs.fee_reserve     = config.network_fee;
         needs.change_required = true;

         auto sel = select_inputs( without( native_only( *wallet ), needs.preselected ), needs, config.selection );
         if( sel.is_failure() ) return run.fail( sel.error() );

         auto pot = provider.get_spendable_outputs( request.contracts.pot_address );
         if( pot.is_failure() ) return run.fail( pot.error() );

         run.enter( verifying_oracle_state );
         auto record = provider.get_oracle_record( request.game.id, request.contracts.oracle_policy_id );
         if( record.is_failure() ) return run.fail( record.error() );

         auto verdict = bead::oracle::verify_oracle( *record,
                                                     bead::oracle::oracle_expectation( request.game.id,
                                                                                       request.contracts.bet_policy_id,
                                                                                       request.outcome ),
                                                     request.contracts, request.game.name, run.now(), config );
         if( verdict.is_failure() ) return run.fail( verdict.error() );

         run.enter( accounting_state );
         auto acct = account_redemption( bet_unit, held, verdict->record, verdict->eligible, config );
         if( acct.is_failure() ) return run.fail( acct.error() );

         redeem_details details;
         details.accounting = *acct;
         details.oracle     = *verdict;

         vector<string> warnings( verdict->warnings );
         warnings.insert( warnings.end(), acct->warnings.begin(), acct->warnings.end() );

         vector<spendable_output> pot_inputs;
         if( acct->payout > 0 )
         {
            selection_request payout;
            payout.target = acct->payout;
            auto pot_sel = select_inputs( native_only( *pot ), payout, config.selection );
            if( pot_sel.is_failure() )
               return run.fail( pot_sel.error().with_context( "pot_address", request.contracts.pot_address ) );

            pot_inputs              = detail::resolve( *pot, pot_sel->inputs );
            details.pot_selection   = *pot_sel;
            details.pot_value_spent = pot_sel->total_input;
            if( pot_sel->efficiency * 100 < config.min_payout_efficiency_percent )
               warnings.push_back( "payout uses pot outputs inefficiently" );
         }

         run.enter( building_state );
         transaction_builder builder( config );
         builder.spend( detail::resolve( *wallet, sel->inputs ) )
                .spend( pot_inputs );
         for( const auto& b : burns )
            builder.burn( request.actor, b.unit, -b.quantity );
         if( acct->payout > 0 )
            builder.transfer( request.contracts.pot_address, request.actor, asset( acct->payout ) );

         auto validity = detail::make_validity( std::max( run.now(), request.game.start_time ),
                                                run.now() + config.transaction_expiration_sec );
         builder.pay_fee( request.actor, config.network_fee )
                .set_validity( validity )
                .require_signature( request.actor )
                .set_memo( "redeem " + request.game.name );
         const auto& trx = builder.finalize();

         auto mismatch = detail::check_deltas( acct->deltas, trx.mint );
         if( mismatch.valid() ) return run.fail( *mismatch );

         auto id = provider.submit_transaction( trx );
         if( id.is_failure() ) return run.fail_submission( id.error() );

         operation_outcome outcome;
         if( acct->refunded )
            outcome.summary = "Refunded " + detail::ada_string( acct->payout ) + " for " + request.game.name;
         else if( acct->payout > 0 )
            outcome.summary = "Redeemed " + fc::to_string( held ) + " bet tokens for " + detail::ada_string( acct->payout );
         else
            outcome.summary = "Burned " + fc::to_string( held ) + " losing bet tokens for " + request.game.name;
         outcome.token_deltas = trx.mint;
         outcome.selection    = *sel;
         outcome.validity     = validity;
         outcome.transaction  = trx;
         outcome.details.redeem = details;
         outcome.warnings     = warnings;
         detail::add_selection_warnings( *sel, outcome.warnings );
         return run.finish( outcome, *id );
      }
      catch( const fc::exception& e )
      {
         return run.fail( e );
      }
   }

   result<operation_outcome> publish_game_result( const publish_game_result_request& request,
                                                  const protocol_config& config,
                                                  ledger_provider& provider )
   {
      detail::orchestration_run run( publish_game_result_op_type );
      try {
         auto clock_failure = run.read_clock( provider );
         if( clock_failure.valid() ) return *clock_failure;

         auto valid = validate( request, config, run.now() );
         if( valid.is_failure() ) return run.fail( valid.error() );

         run.enter( selecting_state );
         auto wallet = provider.get_spendable_outputs( request.actor );
         if( wallet.is_failure() ) return run.fail( wallet.error() );

         selection_request needs;
         needs.target      = config.oracle_payout_value;
         needs.fee_reserve = config.network_fee;
         auto sel = select_inputs( native_only( *wallet ), needs, config.selection );
         if( sel.is_failure() ) return run.fail( sel.error() );

         auto pot = provider.get_spendable_outputs( request.contracts.pot_address );
         if( pot.is_failure() ) return run.fail( pot.error() );

         run.enter( accounting_state );
         auto acct = account_game_result( request, *pot, run.now(), config );
         if( acct.is_failure() ) return run.fail( acct.error() );

         run.enter( building_state );
         asset_map oracle_assets = detail::lovelace( config.oracle_payout_value );
         oracle_assets[acct->oracle_unit] = 1;
         transaction_output oracle_output( request.contracts.pot_address, oracle_assets );
         oracle_output.oracle = acct->record;

         auto validity = detail::make_validity( std::max( run.now(), request.game.start_time ),
                                                run.now() + config.transaction_expiration_sec );
         transaction_builder builder( config );
         builder.spend( detail::resolve( *wallet, sel->inputs ) )
                .mint( request.actor, acct->oracle_unit, 1 )
                .pay( request.actor, oracle_output )
                .pay_fee( request.actor, config.network_fee )
                .set_validity( validity )
                .require_signature( request.actor )
                .set_memo( "result " + request.game.name + " " + request.result_label );
         const auto& trx = builder.finalize();

         auto mismatch = detail::check_deltas( acct->deltas, trx.mint );
         if( mismatch.valid() ) return run.fail( *mismatch );

         auto id = provider.submit_transaction( trx );
         if( id.is_failure() ) return run.fail_submission( id.error() );

         operation_outcome outcome;
         outcome.summary = "Published " + request.result_label + " (" + outcome_description( request.winner ) +
                           ") for " + request.game.name;
         outcome.token_deltas = trx.mint;
         outcome.selection    = *sel;
         outcome.validity     = validity;
         outcome.transaction  = trx;
         outcome.details.publish = *acct;
         outcome.warnings     = acct->warnings;
         detail::add_selection_warnings( *sel, outcome.warnings );
         return run.finish( outcome, *id );
      }
      catch( const fc::exception& e )
      {
         return run.fail( e );
      }
   }

   result<operation_outcome> collect_treasury( const collect_treasury_request& request,
                                               const protocol_config& config,
                                               ledger_provider& provider )
   {
      detail::orchestration_run run( collect_treasury_op_type );
      try {
         auto clock_failure = run.read_clock( provider );
         if( clock_failure.valid() ) return *clock_failure;

         auto valid = validate( request, config, run.now() );
         if( valid.is_failure() ) return run.fail( valid.error() );

         run.enter( selecting_state );
         auto pot = provider.get_spendable_outputs( request.contracts.pot_address );
         if( pot.is_failure() ) return run.fail( pot.error() );

         run.enter( accounting_state );
         auto acct = account_collection( request, *pot, config );
         if( acct.is_failure() ) return run.fail( acct.error() );

         run.enter( building_state );
         const auto& pot_address = request.contracts.pot_address;
         transaction_builder builder( config );
         builder.spend( acct->swept );
         for( const auto& d : acct->deltas )
            builder.burn( pot_address, d.unit, -d.quantity );

         auto validity = detail::make_validity( run.now(), run.now() + config.transaction_expiration_sec );
         builder.pay( pot_address, transaction_output( config.treasury_address, detail::lovelace( acct->collected ) ) )
                .pay_fee( pot_address, config.network_fee )
                .set_validity( validity )
                .require_signature( request.actor )
                .set_memo( "collect " + fc::to_string( request.game.id ) );
         const auto& trx = builder.finalize();

         auto mismatch = detail::check_deltas( acct->deltas, trx.mint );
         if( mismatch.valid() ) return run.fail( *mismatch );

         auto id = provider.submit_transaction( trx );
         if( id.is_failure() ) return run.fail_submission( id.error() );

         operation_outcome outcome;
         outcome.summary = "Collected " + detail::ada_string( acct->collected ) + " from " +
                           fc::to_string( uint64_t( acct->swept.size() ) ) + " pot outputs";
         outcome.token_deltas = trx.mint;
         outcome.validity     = validity;
         outcome.transaction  = trx;
         outcome.details.collect = *acct;
         outcome.warnings     = acct->warnings;
         return run.finish( outcome, *id );
      }
      catch( const fc::exception& e )
      {
         return run.fail( e );
      }
   }

} } // bead::wallet
