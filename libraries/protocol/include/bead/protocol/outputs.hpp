#pragma once

#include <bead/protocol/asset.hpp>

namespace bead { namespace protocol {

   struct output_reference
   {
      output_reference():index(0){}
      output_reference( const transaction_id_type& id, uint32_t i ):trx_id(id),index(i){}

      transaction_id_type  trx_id;
      uint32_t             index;

      string to_string()const;

      friend bool operator < ( const output_reference& a, const output_reference& b )
      {
         return std::tie( a.trx_id, a.index ) < std::tie( b.trx_id, b.index );
      }
      friend bool operator == ( const output_reference& a, const output_reference& b )
      {
         return std::tie( a.trx_id, a.index ) == std::tie( b.trx_id, b.index );
      }
      friend bool operator != ( const output_reference& a, const output_reference& b )
      {
         return !( a == b );
      }
   };

   /** Datum attached to the pot output of a placed bet */
   struct bet_datum
   {
      bet_datum():game_id(0),outcome(tie_outcome),bet_tokens(0){}

      game_id_type   game_id;
      game_outcome   outcome;
      share_type     bet_tokens;
   };

   /**
    *  Published result and statistics of a game.  A record without a settled outcome
    *  describes a game the oracle knows about but has not decided yet.
    */
   struct oracle_record
   {
      oracle_record():game_id(0),total_pool(0),total_winnings(0){}

      game_id_type              game_id;
      string                    game_name;
      optional<game_outcome>    settled_outcome;
      policy_id_type            bet_policy_id;
      share_type                total_pool;
      share_type                total_winnings;
      string                    result_label;
      time_point_sec            published;

      bool is_settled()const { return settled_outcome.valid(); }
   };

   struct transaction_output
   {
      transaction_output(){}
      transaction_output( const address_type& a, const asset_map& v ):address(a),assets(v){}

      address_type              address;
      asset_map                 assets;
      optional<bet_datum>       bet;
      optional<oracle_record>   oracle;

      share_type native()const { return native_amount( assets ); }
   };

   /** Ledger output the actor may consume, as reported by the ledger provider */
   struct spendable_output
   {
      output_reference          id;
      address_type              address;
      asset_map                 assets;
      optional<bet_datum>       bet;
      optional<oracle_record>   oracle;

      share_type native()const { return native_amount( assets ); }
      share_type quantity( const asset_unit_type& unit )const { return quantity_of( assets, unit ); }
   };

   /** Mint (positive) or burn (negative) of one unit */
   struct token_delta
   {
      token_delta():quantity(0){}
      token_delta( const asset_unit_type& u, share_type q ):unit(u),quantity(q){}

      asset_unit_type  unit;
      share_type       quantity;
   };

   struct validity_interval
   {
      optional<time_point_sec>  valid_from;
      optional<time_point_sec>  valid_to;

      bool contains( const time_point_sec& t )const;
   };

   /**
    *  Everything the ledger provider needs to construct, sign and submit a transaction.
    *  The description balances: inputs + mints = outputs + burns + fee for every unit.
    */
   struct transaction_description
   {
      transaction_description():fee(0){}

      vector<output_reference>     inputs;
      vector<transaction_output>   outputs;
      vector<token_delta>          mint;
      share_type                   fee;
      validity_interval            validity;
      set<address_type>            required_signers;
      string                       memo;
   };

} } // bead::protocol

FC_REFLECT( bead::protocol::output_reference, (trx_id)(index) )
FC_REFLECT( bead::protocol::bet_datum, (game_id)(outcome)(bet_tokens) )
FC_REFLECT( bead::protocol::oracle_record,
            (game_id)(game_name)(settled_outcome)(bet_policy_id)(total_pool)(total_winnings)(result_label)(published) )
FC_REFLECT( bead::protocol::transaction_output, (address)(assets)(bet)(oracle) )
FC_REFLECT( bead::protocol::spendable_output, (id)(address)(assets)(bet)(oracle) )
FC_REFLECT( bead::protocol::token_delta, (unit)(quantity) )
FC_REFLECT( bead::protocol::validity_interval, (valid_from)(valid_to) )
FC_REFLECT( bead::protocol::transaction_description, (inputs)(outputs)(mint)(fee)(validity)(required_signers)(memo) )
