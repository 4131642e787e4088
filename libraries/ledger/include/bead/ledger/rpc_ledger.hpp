#pragma once

#include <bead/ledger/ledger_provider.hpp>

#include <fc/network/ip.hpp>

#include <memory>

namespace bead { namespace ledger {
  namespace detail { class rpc_ledger_impl; }

  /**
  *  @class rpc_ledger
  *  @brief ledger_provider backed by a remote ledger gateway over JSON-RPC
  *
  *  The gateway owns keys, signing and the chain connection.  It serves the methods
  *  get_spendable_outputs, get_oracle_record, submit_transaction and get_time.
  */
  class rpc_ledger : public ledger_provider
  {
     public:
       rpc_ledger();
       virtual ~rpc_ledger();

       void connect_to( const fc::ip::endpoint& remote_endpoint );
       bool is_connected()const;

       virtual result<vector<spendable_output>>   get_spendable_outputs( const address_type& address ) override;
       virtual result<optional<oracle_record>>    get_oracle_record( game_id_type game_id,
                                                                     const policy_id_type& oracle_policy ) override;
       virtual result<transaction_id_type>        submit_transaction( const transaction_description& trx ) override;
       virtual result<time_point_sec>             now() override;

     private:
       std::unique_ptr<detail::rpc_ledger_impl> my;
  };

} } // bead::ledger
