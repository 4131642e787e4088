#include <bead/oracle/oracle_verifier.hpp>

#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/string.hpp>

namespace bead { namespace oracle {

   result<oracle_verdict> verify_oracle( const optional<oracle_record>& record,
                                         const oracle_expectation& expected,
                                         const contract_references& contracts,
                                         const string& game_name,
                                         const time_point_sec& now,
                                         const protocol_config& config )
   {
      try {
         if( !record.valid() || record->game_id != expected.game_id )
         {
            return failure( game_not_found,
                            "No oracle record found for game " + fc::to_string( expected.game_id ),
                            mutable_variant_object( "game_id", expected.game_id )
                                                  ( "oracle_policy_id", contracts.oracle_policy_id )
                                                  ( "record_game_id", record.valid() ? variant( record->game_id ) : variant() ) );
         }

         if( !record->is_settled() )
         {
            return failure( oracle_not_settled,
                            "The oracle has not published a result for game " + fc::to_string( expected.game_id ),
                            mutable_variant_object( "game_id", expected.game_id )
                                                  ( "game_name", record->game_name ) );
         }

         if( record->bet_policy_id != expected.bet_policy_id )
         {
            return failure( policy_mismatch,
                            "Oracle record belongs to a different bet policy",
                            mutable_variant_object( "expected_policy", expected.bet_policy_id )
                                                  ( "record_policy", record->bet_policy_id )
                                                  ( "game_id", expected.game_id ) );
         }

         oracle_verdict verdict;
         verdict.record       = *record;
         verdict.eligible     = *record->settled_outcome == expected.outcome;
         verdict.winning_unit = bet_token_unit( expected.bet_policy_id, *record->settled_outcome, game_name );
         verdict.oracle_unit  = oracle_token_unit( contracts.oracle_policy_id, record->result_label );

         if( now > record->published && uint32_t( now.sec_since_epoch() - record->published.sec_since_epoch() ) > config.max_oracle_age_sec )
         {
            verdict.warnings.push_back( "oracle record is older than the maximum recommended age" );
            wlog( "oracle record for game ${g} was published ${p}", ("g", expected.game_id)("p", record->published) );
         }

         dlog( "oracle settled game ${g} as ${o}, held outcome ${h} eligible: ${e}",
               ("g", expected.game_id)("o", *record->settled_outcome)("h", expected.outcome)("e", verdict.eligible) );
         return verdict;
      }
      catch( const fc::exception& e )
      {
         return failure_from_exception( accounting_error, "Unable to verify the oracle record", e );
      }
   }

} } // bead::oracle
