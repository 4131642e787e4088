#include <bead/protocol/result.hpp>

#include <fc/reflect/variant.hpp>
#include <fc/io/json.hpp>

namespace bead { namespace protocol {

   string failure_code_name( failure_code code )
   {
      switch( code )
      {
         case invalid_input:      return "INVALID_INPUT";
         case insufficient_funds: return "INSUFFICIENT_FUNDS";
         case too_many_inputs:    return "TOO_MANY_INPUTS";
         case game_not_found:     return "GAME_NOT_FOUND";
         case oracle_not_settled: return "ORACLE_NOT_SETTLED";
         case policy_mismatch:    return "POLICY_MISMATCH";
         case accounting_error:   return "ACCOUNTING_ERROR";
         case transaction_failed: return "TRANSACTION_FAILED";
         case network_error:      return "NETWORK_ERROR";
      }
      return "UNKNOWN_ERROR";
   }

   vector<string> default_suggestions( failure_code code )
   {
      switch( code )
      {
         case invalid_input:
            return { "Check the request parameters against the protocol limits" };
         case insufficient_funds:
            return { "Add more funds to your wallet", "Reduce the requested amount" };
         case too_many_inputs:
            return { "Consolidate small outputs into a larger one", "Reduce the requested amount" };
         case game_not_found:
            return { "Check the game id", "Ensure you're connected to the correct network" };
         case oracle_not_settled:
            return { "Wait for the oracle to publish the game result" };
         case policy_mismatch:
            return { "Verify the bet policy id for this game", "Contact support if the issue persists" };
         case accounting_error:
            return { "Contact support if the issue persists" };
         case transaction_failed:
            return { "Try the operation again", "Check your network connection" };
         case network_error:
            return { "Check your network connection", "Try the operation again later" };
      }
      return vector<string>();
   }

   failure::failure( failure_code c,
                     const string& msg,
                     const variant_object& ctx,
                     const vector<string>& hints )
   :code(c),message(msg),context(ctx),suggestions(hints)
   {
      if( suggestions.empty() )
         suggestions = default_suggestions( code );
   }

   failure failure::with_context( const string& key, const variant& value )const
   {
      mutable_variant_object ctx( context );
      ctx.set( key, value );
      failure tmp( *this );
      tmp.context = variant_object( ctx );
      return tmp;
   }

   string failure::to_string()const
   {
      return failure_code_name( code ) + ": " + message + " " + fc::json::to_string( context );
   }

   failure failure_from_exception( failure_code code, const string& message, const fc::exception& e )
   {
      return failure( code, message,
                      mutable_variant_object( "exception", e.name() )
                                            ( "exception_code", e.code() )
                                            ( "detail", e.to_detail_string() ) );
   }

} } // bead::protocol
