#pragma once

#include <bead/protocol/outputs.hpp>
#include <bead/protocol/result.hpp>

namespace bead { namespace ledger {

   using namespace bead::protocol;

   /**
    *  @class ledger_provider
    *  @brief The only way the core talks to a ledger.
    *
    *  Queries return snapshots; nothing is cached between calls.  Implementations
    *  report problems as failures and never let an exception escape.
    */
   class ledger_provider
   {
      public:
         virtual ~ledger_provider(){}

         virtual result<vector<spendable_output>>   get_spendable_outputs( const address_type& address ) = 0;

         /** An empty optional means the ledger holds no record for the game */
         virtual result<optional<oracle_record>>    get_oracle_record( game_id_type game_id,
                                                                       const policy_id_type& oracle_policy ) = 0;

         virtual result<transaction_id_type>        submit_transaction( const transaction_description& trx ) = 0;

         /** Ledger time, the reference for validity windows; never substituted by a local clock */
         virtual result<time_point_sec>             now() = 0;
   };

} } // bead::ledger
