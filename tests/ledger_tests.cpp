#include "bead_fixture.hpp"

#include <bead/protocol/exceptions.hpp>
#include <bead/wallet/transaction_builder.hpp>

BOOST_FIXTURE_TEST_SUITE( ledger_tests, ledger_fixture )

BOOST_AUTO_TEST_CASE( funded_outputs_are_spendable )
{
   try {
      auto outputs = ledger.get_spendable_outputs( "addr_alice" );
      BEAD_REQUIRE_SUCCESS( outputs );
      BOOST_CHECK_EQUAL( outputs->size(), 2u );
      BOOST_CHECK_EQUAL( ledger.balance( "addr_alice" ), ada( 500 ) );
      BOOST_CHECK_EQUAL( ledger.output_queries(), 1u );

      auto nobody = ledger.get_spendable_outputs( "addr_nobody" );
      BEAD_REQUIRE_SUCCESS( nobody );
      BOOST_CHECK( nobody->empty() );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( applies_a_balanced_transaction )
{
   try {
      auto outputs = *ledger.get_spendable_outputs( "addr_bob" );

      transaction_builder builder( config );
      builder.spend( outputs )
             .pay( "addr_bob", transaction_output( "addr_alice", normalized( { { native_unit(), ada( 100 ) } } ) ) )
             .pay_fee( "addr_bob", config.network_fee );
      validity_interval window;
      window.valid_from = start_time;
      window.valid_to   = start_time + 3600;
      builder.set_validity( window );

      auto id = ledger.submit_transaction( builder.finalize() );
      BEAD_REQUIRE_SUCCESS( id );
      BOOST_CHECK_EQUAL( id->size(), 64u );
      BOOST_CHECK_EQUAL( ledger.balance( "addr_alice" ), ada( 600 ) );
      BOOST_CHECK_EQUAL( ledger.balance( "addr_bob" ), ada( 400 ) - config.network_fee );

      // the same inputs are gone now
      BEAD_REQUIRE_FAILURE( ledger.submit_transaction( builder.description() ), transaction_failed );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( rejects_invalid_transactions )
{
   try {
      auto outputs = *ledger.get_spendable_outputs( "addr_bob" );

      transaction_description trx;
      trx.inputs.push_back( outputs.front().id );
      trx.outputs.push_back( transaction_output( "addr_bob", normalized( { { native_unit(), ada( 500 ) - config.network_fee } } ) ) );
      trx.fee = config.network_fee;

      trx.validity.valid_to = start_time;
      auto expired = ledger.submit_transaction( trx );
      BEAD_REQUIRE_FAILURE( expired, transaction_failed );
      BOOST_CHECK_EQUAL( expired.error().context["exception_code"].as_int64(), expired_transaction::code_value );

      trx.validity.valid_to.reset();
      trx.fee = 1;
      trx.outputs.front().assets[native_unit()] = ada( 500 ) - 1;
      auto cheap = ledger.submit_transaction( trx );
      BEAD_REQUIRE_FAILURE( cheap, transaction_failed );
      BOOST_CHECK_EQUAL( cheap.error().context["exception_code"].as_int64(), insufficient_fee::code_value );

      trx.fee = config.network_fee;
      trx.outputs.front().assets[native_unit()] = ada( 500 );
      auto unbalanced = ledger.submit_transaction( trx );
      BEAD_REQUIRE_FAILURE( unbalanced, transaction_failed );
      BOOST_CHECK_EQUAL( unbalanced.error().context["exception_code"].as_int64(), unbalanced_transaction::code_value );

      trx.outputs.front().assets[native_unit()] = ada( 500 ) - config.network_fee;
      trx.inputs.front().index = 9;
      auto unknown = ledger.submit_transaction( trx );
      BEAD_REQUIRE_FAILURE( unknown, transaction_failed );
      BOOST_CHECK_EQUAL( unknown.error().context["exception_code"].as_int64(), unknown_output::code_value );

      BOOST_CHECK( ledger.submitted().empty() );
      BOOST_CHECK_EQUAL( ledger.balance( "addr_bob" ), ada( 500 ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( failure_switches )
{
   try {
      ledger.reject_queries( true );
      BEAD_REQUIRE_FAILURE( ledger.get_spendable_outputs( "addr_alice" ), network_error );
      BEAD_REQUIRE_FAILURE( ledger.get_oracle_record( 42, "oraclepolicy" ), network_error );
      BEAD_REQUIRE_FAILURE( ledger.now(), network_error );
      ledger.reject_queries( false );

      ledger.advance( 90 );
      BEAD_REQUIRE_SUCCESS( ledger.now() );
      BOOST_CHECK( *ledger.now() == start_time + 90 );

      ledger.reject_submissions( true );
      transaction_description trx;
      BEAD_REQUIRE_FAILURE( ledger.submit_transaction( trx ), transaction_failed );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( oracle_records_are_found_at_the_pot )
{
   try {
      auto none = ledger.get_oracle_record( 42, "oraclepolicy" );
      BEAD_REQUIRE_SUCCESS( none );
      BOOST_CHECK( !none->valid() );

      oracle_record record;
      record.game_id         = 42;
      record.settled_outcome = away_outcome;
      record.bet_policy_id   = "betpolicy";
      record.result_label    = "0-1";

      transaction_output output( "addr_pot", normalized( { { native_unit(), ada( 2 ) }, { "oraclepolicy.0-1", 1 } } ) );
      output.oracle = record;
      ledger.add_output( output );

      auto found = ledger.get_oracle_record( 42, "oraclepolicy" );
      BEAD_REQUIRE_SUCCESS( found );
      BOOST_REQUIRE( found->valid() );
      BOOST_CHECK( *( *found )->settled_outcome == away_outcome );

      auto other_policy = ledger.get_oracle_record( 42, "someoneelse" );
      BEAD_REQUIRE_SUCCESS( other_policy );
      BOOST_CHECK( !other_policy->valid() );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
