#pragma once

#include <bead/protocol/operations.hpp>
#include <bead/protocol/protocol_config.hpp>
#include <bead/protocol/result.hpp>

#include <functional>

namespace bead { namespace protocol {

   /** Everything a rule may look at besides the request itself */
   struct validation_context
   {
      validation_context( const protocol_config& c, const time_point_sec& n ):config(c),now(n){}

      const protocol_config&  config;
      time_point_sec          now;
   };

   /**
    *  A named check on one field of a request.  A violated rule produces an
    *  invalid_input failure carrying the field, the offending value, the expected
    *  format and the suggestion.
    */
   template<typename Request>
   struct validation_rule
   {
      typedef std::function<bool( const Request&, const validation_context& )>  predicate_type;
      typedef std::function<variant( const Request& )>                          value_type;

      string           field;
      string           expected;
      string           suggestion;
      predicate_type   check;
      value_type       value;
   };

   template<typename Request>
   result<Request> apply_rules( const vector<validation_rule<Request>>& rules,
                                const Request& request,
                                const validation_context& ctx )
   {
      for( const auto& rule : rules )
      {
         if( rule.check( request, ctx ) )
            continue;

         return failure( invalid_input,
                         "Invalid " + rule.field + ": expected " + rule.expected,
                         mutable_variant_object( "field", rule.field )
                                               ( "value", rule.value( request ) )
                                               ( "expected", rule.expected ),
                         vector<string>{ rule.suggestion } );
      }
      return request;
   }

   /**
    *  @defgroup validation Request validation
    *
    *  Pure checks run before any ledger interaction.  The same request validated
    *  twice with the same configuration and time yields the same result.
    */
   /// @{
   result<place_bet_request>            validate( const place_bet_request& request,
                                                  const protocol_config& config,
                                                  const time_point_sec& now );
   result<purchase_token_request>       validate( const purchase_token_request& request,
                                                  const protocol_config& config,
                                                  const time_point_sec& now );
   result<redeem_bet_request>           validate( const redeem_bet_request& request,
                                                  const protocol_config& config,
                                                  const time_point_sec& now );
   result<publish_game_result_request>  validate( const publish_game_result_request& request,
                                                  const protocol_config& config,
                                                  const time_point_sec& now );
   result<collect_treasury_request>     validate( const collect_treasury_request& request,
                                                  const protocol_config& config,
                                                  const time_point_sec& now );
   /// @}

} } // bead::protocol
