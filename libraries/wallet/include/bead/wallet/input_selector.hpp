#pragma once

#include <bead/protocol/outputs.hpp>
#include <bead/protocol/protocol_config.hpp>
#include <bead/protocol/result.hpp>

namespace bead { namespace wallet {

   using namespace bead::protocol;

   enum selection_strategy
   {
      optimal_selection  = 1,
      greedy_selection   = 2,
      fallback_selection = 3
   };

   struct selection_request
   {
      selection_request():target(0),fee_reserve(0),change_required(false){}

      share_type                  target;
      share_type                  fee_reserve;
      /** change must be at least the minimum output value, zero change is not enough */
      bool                        change_required;
      /** outputs that must be spent regardless, e.g. token bearing outputs */
      vector<spendable_output>    preselected;

      share_type needed()const { return checked_add( target, fee_reserve ); }
   };

   struct selection_result
   {
      selection_result()
      :target(0),fee_reserve(0),total_input(0),change(0),efficiency(0),strategy(optimal_selection),dust_skipped(0){}

      share_type                  target;
      share_type                  fee_reserve;
      vector<output_reference>    inputs;
      /** every unit gathered by the inputs, tokens included */
      asset_map                   gathered;
      share_type                  total_input;
      share_type                  change;
      double                      efficiency;
      selection_strategy          strategy;
      uint32_t                    dust_skipped;
   };

   /**
    *  Picks outputs from available so that their native value covers
    *  request.target + request.fee_reserve.
    *
    *  The strategies are tried in order: OPTIMAL searches small combinations of the
    *  largest outputs for a tight match, GREEDY walks the outputs largest first, and
    *  FALLBACK repeats the walk with dust outputs appended.  Outputs below the dust
    *  threshold are only consumed by FALLBACK.  Change is either zero or at least
    *  the minimum output value.
    *
    *  Fails with insufficient_funds or too_many_inputs, never with a partial selection.
    */
   result<selection_result> select_inputs( const vector<spendable_output>& available,
                                           const selection_request& request,
                                           const selection_policy& policy );

   /**
    *  Picks outputs holding unit, largest holding first, until quantity is covered.
    */
   result<vector<spendable_output>> select_token_inputs( const vector<spendable_output>& available,
                                                         const asset_unit_type& unit,
                                                         share_type quantity,
                                                         const selection_policy& policy );

   /** All outputs holding any quantity of unit */
   vector<spendable_output> outputs_holding( const vector<spendable_output>& available,
                                             const asset_unit_type& unit );

   /** Outputs that hold nothing but the native unit and carry no oracle record */
   vector<spendable_output> native_only( const vector<spendable_output>& available );

   /** Available outputs minus those referenced by excluded */
   vector<spendable_output> without( const vector<spendable_output>& available,
                                     const vector<spendable_output>& excluded );

} } // bead::wallet

FC_REFLECT_ENUM( bead::wallet::selection_strategy, (optimal_selection)(greedy_selection)(fallback_selection) )
FC_REFLECT( bead::wallet::selection_request, (target)(fee_reserve)(change_required)(preselected) )
FC_REFLECT( bead::wallet::selection_result,
            (target)(fee_reserve)(inputs)(gathered)(total_input)(change)(efficiency)(strategy)(dust_skipped) )
