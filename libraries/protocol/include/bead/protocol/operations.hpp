#pragma once

#include <bead/protocol/outputs.hpp>

namespace bead { namespace protocol {

   enum operation_type_enum
   {
      place_bet_op_type           = 1,
      purchase_token_op_type      = 2,
      redeem_bet_op_type          = 3,
      publish_game_result_op_type = 4,
      collect_treasury_op_type    = 5
   };

   /**
    *  Lock a stake in the pot of a game and receive bet tokens for the predicted
    *  outcome.  Either currency may be zero but not both.
    */
   struct place_bet_request
   {
      place_bet_request():outcome(tie_outcome),stake(0),bead_stake(0){}

      address_type          actor;
      game_reference        game;
      game_outcome          outcome;
      share_type            stake;        ///< lovelace
      share_type            bead_stake;   ///< whole BEAD
      contract_references   contracts;
   };

   /** Contribute lovelace to the treasury in exchange for BEAD */
   struct purchase_token_request
   {
      purchase_token_request():contribution(0){}

      address_type              actor;
      share_type                contribution; ///< lovelace
      optional<address_type>    referrer;
   };

   /**
    *  Burn the bet tokens the actor holds for one outcome of a settled game and
    *  collect the payout they entitle to.
    */
   struct redeem_bet_request
   {
      redeem_bet_request():outcome(tie_outcome),close_oracle(false){}

      address_type          actor;
      game_reference        game;
      game_outcome          outcome;
      contract_references   contracts;
      bool                  close_oracle;
   };

   /** Oracle operator publishes the final result of a game */
   struct publish_game_result_request
   {
      publish_game_result_request():winner(tie_outcome){}

      address_type          actor;
      game_reference        game;
      game_outcome          winner;
      string                result_label; ///< final score, names the oracle token
      contract_references   contracts;
   };

   /** Treasury sweeps what is left of a settled game in the pot once redemptions are over */
   struct collect_treasury_request
   {
      address_type          actor;
      game_reference        game;
      contract_references   contracts;
   };

   asset_unit_type bet_token_unit( const policy_id_type& bet_policy, game_outcome outcome, const string& game_name );
   asset_unit_type oracle_token_unit( const policy_id_type& oracle_policy, const string& result_label );

} } // bead::protocol

FC_REFLECT_ENUM( bead::protocol::operation_type_enum,
                 (place_bet_op_type)
                 (purchase_token_op_type)
                 (redeem_bet_op_type)
                 (publish_game_result_op_type)
                 (collect_treasury_op_type)
               )
FC_REFLECT( bead::protocol::place_bet_request, (actor)(game)(outcome)(stake)(bead_stake)(contracts) )
FC_REFLECT( bead::protocol::purchase_token_request, (actor)(contribution)(referrer) )
FC_REFLECT( bead::protocol::redeem_bet_request, (actor)(game)(outcome)(contracts)(close_oracle) )
FC_REFLECT( bead::protocol::publish_game_result_request, (actor)(game)(winner)(result_label)(contracts) )
FC_REFLECT( bead::protocol::collect_treasury_request, (actor)(game)(contracts) )
