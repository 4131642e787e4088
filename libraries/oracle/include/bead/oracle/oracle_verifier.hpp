#pragma once

#include <bead/protocol/operations.hpp>
#include <bead/protocol/protocol_config.hpp>
#include <bead/protocol/result.hpp>

namespace bead { namespace oracle {

   using namespace bead::protocol;

   /** What the redeemer holds: bet tokens of one outcome under one bet policy */
   struct oracle_expectation
   {
      oracle_expectation():game_id(0),outcome(tie_outcome){}
      oracle_expectation( game_id_type g, const policy_id_type& p, game_outcome o )
      :game_id(g),bet_policy_id(p),outcome(o){}

      game_id_type     game_id;
      policy_id_type   bet_policy_id;
      game_outcome     outcome;
   };

   struct oracle_verdict
   {
      oracle_verdict():eligible(false){}

      oracle_record     record;
      /** the held outcome is the settled one */
      bool              eligible;
      asset_unit_type   winning_unit;
      asset_unit_type   oracle_unit;
      vector<string>    warnings;
   };

   /**
    *  Checks an oracle record read from the ledger against what the redeemer holds.
    *
    *  A missing record or one for another game is game_not_found, a record without a
    *  settled outcome is oracle_not_settled and a record for a different bet policy is
    *  policy_mismatch.  Holding the losing outcome is not a failure: the verdict is
    *  returned with eligible == false.
    */
   result<oracle_verdict> verify_oracle( const optional<oracle_record>& record,
                                         const oracle_expectation& expected,
                                         const contract_references& contracts,
                                         const string& game_name,
                                         const time_point_sec& now,
                                         const protocol_config& config );

} } // bead::oracle

FC_REFLECT( bead::oracle::oracle_expectation, (game_id)(bet_policy_id)(outcome) )
FC_REFLECT( bead::oracle::oracle_verdict, (record)(eligible)(winning_unit)(oracle_unit)(warnings) )
