#include <bead/protocol/operations.hpp>

namespace bead { namespace protocol {

   bool is_defined_outcome( int64_t value )
   {
      return value == tie_outcome || value == home_outcome || value == away_outcome;
   }

   char outcome_digit( game_outcome o )
   {
      return char( '0' + int( o ) );
   }

   string outcome_description( game_outcome o )
   {
      switch( o )
      {
         case tie_outcome:  return "Draw";
         case home_outcome: return "Home Win";
         case away_outcome: return "Away Win";
      }
      return "Unknown";
   }

   asset_unit_type bet_token_unit( const policy_id_type& bet_policy, game_outcome outcome, const string& game_name )
   {
      return make_unit( bet_policy, string( 1, outcome_digit( outcome ) ) + game_name );
   }

   asset_unit_type oracle_token_unit( const policy_id_type& oracle_policy, const string& result_label )
   {
      return make_unit( oracle_policy, result_label );
   }

} } // bead::protocol
