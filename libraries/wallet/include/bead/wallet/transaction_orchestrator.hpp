#pragma once

#include <bead/ledger/ledger_provider.hpp>
#include <bead/oracle/oracle_verifier.hpp>
#include <bead/wallet/input_selector.hpp>
#include <bead/wallet/token_accounting.hpp>

namespace bead { namespace wallet {

   using bead::ledger::ledger_provider;
   using bead::oracle::oracle_verdict;

   enum orchestrator_state
   {
      validating_state       = 1,
      selecting_state        = 2,
      verifying_oracle_state = 3,
      accounting_state       = 4,
      building_state         = 5,
      submitted_state        = 6,
      done_state             = 7,
      failed_state           = 8
   };

   string state_name( orchestrator_state s );
   string operation_name( operation_type_enum op );

   struct redeem_details
   {
      redeem_details():pot_value_spent(0){}

      redemption_accounting        accounting;
      oracle_verdict               oracle;
      /** pot outputs spent for the payout, absent when nothing is paid */
      optional<selection_result>   pot_selection;
      share_type                   pot_value_spent;
   };

   /** Exactly one member is set, matching the operation */
   struct operation_details
   {
      optional<bet_accounting>           bet;
      optional<purchase_accounting>      purchase;
      optional<redeem_details>           redeem;
      optional<publication_accounting>   publish;
      optional<collection_accounting>    collect;
   };

   struct operation_outcome
   {
      operation_outcome():operation(place_bet_op_type){}

      operation_type_enum          operation;
      transaction_id_type          transaction_id;
      string                       summary;
      /** mints (positive) and burns (negative) handed to the ledger */
      vector<token_delta>          token_deltas;
      vector<string>               warnings;
      /** inputs picked from the actor wallet; absent for operations funded by the pot */
      optional<selection_result>   selection;
      validity_interval            validity;
      transaction_description      transaction;
      operation_details            details;
      vector<orchestrator_state>   transitions;
   };

   /**
    *  @defgroup orchestrator Transaction orchestration
    *
    *  Each entry point drives one request through
    *  validating -> selecting -> (verifying_oracle) -> accounting -> building -> submitted -> done
    *  and returns the outcome, or the failure of the stage that stopped it with "stage" and
    *  "operation" added to its context.  The ledger is asked for the time once and for each
    *  snapshot once; the oracle record is only read while redeeming.  Nothing is retried.
    */
   /// @{
   result<operation_outcome> place_bet( const place_bet_request& request,
                                        const protocol_config& config,
                                        ledger_provider& provider );

   result<operation_outcome> purchase_token( const purchase_token_request& request,
                                             const protocol_config& config,
                                             ledger_provider& provider );

   result<operation_outcome> redeem_bet( const redeem_bet_request& request,
                                         const protocol_config& config,
                                         ledger_provider& provider );

   result<operation_outcome> publish_game_result( const publish_game_result_request& request,
                                                  const protocol_config& config,
                                                  ledger_provider& provider );

   result<operation_outcome> collect_treasury( const collect_treasury_request& request,
                                               const protocol_config& config,
                                               ledger_provider& provider );
   /// @}

} } // bead::wallet

FC_REFLECT_ENUM( bead::wallet::orchestrator_state,
                 (validating_state)
                 (selecting_state)
                 (verifying_oracle_state)
                 (accounting_state)
                 (building_state)
                 (submitted_state)
                 (done_state)
                 (failed_state)
               )
FC_REFLECT( bead::wallet::redeem_details, (accounting)(oracle)(pot_selection)(pot_value_spent) )
FC_REFLECT( bead::wallet::operation_details, (bet)(purchase)(redeem)(publish)(collect) )
FC_REFLECT( bead::wallet::operation_outcome,
            (operation)(transaction_id)(summary)(token_deltas)(warnings)(selection)(validity)(transaction)(details)(transitions) )
