#include <bead/ledger/rpc_ledger.hpp>
#include <bead/protocol/exceptions.hpp>

#include <fc/exception/exception.hpp>

#include <fc/io/buffered_iostream.hpp>
#include <fc/network/tcp_socket.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/rpc/json_connection.hpp>
#include <fc/thread/future.hpp>
#include <fc/thread/thread.hpp>

namespace bead { namespace ledger {

  namespace detail
  {
    class rpc_ledger_impl
    {
    public:
      fc::rpc::json_connection_ptr _json_connection;
      fc::future<void>             _json_exec_loop_complete;

      void connect_to( const fc::ip::endpoint& remote_endpoint );

      void check_connected()const
      {
         if( !_json_connection )
            FC_THROW_EXCEPTION( ledger_unreachable, "not connected to a ledger gateway" );
      }

      fc::variant call( const std::string& method )
      {
         check_connected();
         return _json_connection->call<fc::variant>( method );
      }

      fc::variant call( const std::string& method, const fc::variant& arg )
      {
         check_connected();
         return _json_connection->call<fc::variant>( method, arg );
      }
    };

    void rpc_ledger_impl::connect_to( const fc::ip::endpoint& remote_endpoint )
    {
       fc::tcp_socket_ptr socket = std::make_shared<fc::tcp_socket>();

       try
       {
          socket->connect_to( remote_endpoint );
       }
       catch ( const fc::exception& e )
       {
          elog( "fatal: error opening RPC socket to ledger gateway ${endpoint}: ${e}", ("endpoint", remote_endpoint)("e", e.to_detail_string() ) );
          throw;
       }

       fc::buffered_istream_ptr buffered_istream = std::make_shared<fc::buffered_istream>( socket );
       fc::buffered_ostream_ptr buffered_ostream = std::make_shared<fc::buffered_ostream>( socket );

       _json_connection = std::make_shared<fc::rpc::json_connection>( std::move( buffered_istream ),
                                                                      std::move( buffered_ostream ) );
       _json_exec_loop_complete = fc::async( [=](){ _json_connection->exec(); }, "json exec loop" );
       ilog( "connected to ledger gateway ${endpoint}", ("endpoint", remote_endpoint) );
    }

  } // end namespace detail

  rpc_ledger::rpc_ledger() :
    my( new detail::rpc_ledger_impl )
  {
  }

  rpc_ledger::~rpc_ledger()
  {
     try
     {
        if( my->_json_exec_loop_complete.valid() )
           my->_json_exec_loop_complete.cancel_and_wait( "~rpc_ledger()" );
     } catch ( const fc::exception& e ) {
        wlog( "Caught exception ${e} while canceling json_connection exec loop", ("e", e) );
     }
  }

  void rpc_ledger::connect_to( const fc::ip::endpoint& remote_endpoint )
  {
    my->connect_to( remote_endpoint );
  }

  bool rpc_ledger::is_connected()const
  {
    return my->_json_connection && !my->_json_exec_loop_complete.ready();
  }

  result<vector<spendable_output>> rpc_ledger::get_spendable_outputs( const address_type& address )
  {
    try {
       vector<spendable_output> outputs;
       fc::from_variant( my->call( "get_spendable_outputs", fc::variant( address ) ), outputs );
       return outputs;
    }
    catch ( const fc::exception& e )
    {
       wlog( "output query for ${a} failed: ${e}", ("a", address)("e", e.to_detail_string()) );
       return failure_from_exception( network_error, "Unable to query spendable outputs", e )
                 .with_context( "address", address );
    }
  }

  result<optional<oracle_record>> rpc_ledger::get_oracle_record( game_id_type game_id, const policy_id_type& oracle_policy )
  {
    try {
       fc::mutable_variant_object args( "game_id", game_id );
       args( "oracle_policy_id", oracle_policy );

       optional<oracle_record> record;
       auto reply = my->call( "get_oracle_record", fc::variant( args ) );
       if( !reply.is_null() )
          record = reply.as<oracle_record>();
       return record;
    }
    catch ( const fc::exception& e )
    {
       wlog( "oracle query for game ${g} failed: ${e}", ("g", game_id)("e", e.to_detail_string()) );
       return failure_from_exception( network_error, "Unable to query the oracle record", e )
                 .with_context( "game_id", game_id );
    }
  }

  result<transaction_id_type> rpc_ledger::submit_transaction( const transaction_description& trx )
  {
    try {
       auto reply = my->call( "submit_transaction", fc::variant( trx ) );
       auto id = reply.as_string();
       if( id.empty() )
          FC_THROW_EXCEPTION( submission_rejected, "gateway returned no transaction id" );
       ilog( "gateway accepted transaction ${id}", ("id", id) );
       return id;
    }
    catch ( const fc::exception& e )
    {
       wlog( "submission failed: ${e}", ("e", e.to_detail_string()) );
       return failure_from_exception( transaction_failed, "Ledger gateway rejected the transaction", e );
    }
  }

  result<time_point_sec> rpc_ledger::now()
  {
    try {
       return my->call( "get_time" ).as<time_point_sec>();
    }
    catch ( const fc::exception& e )
    {
       wlog( "unable to read ledger time: ${e}", ("e", e.to_detail_string()) );
       return failure_from_exception( network_error, "Unable to read the ledger time", e );
    }
  }

} } // bead::ledger
