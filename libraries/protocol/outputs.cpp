#include <bead/protocol/outputs.hpp>

#include <fc/reflect/variant.hpp>
#include <fc/string.hpp>

namespace bead { namespace protocol {

   string output_reference::to_string()const
   {
      return trx_id + "#" + fc::to_string( uint64_t( index ) );
   }

   bool validity_interval::contains( const time_point_sec& t )const
   {
      if( valid_from.valid() && t < *valid_from ) return false;
      if( valid_to.valid() && t >= *valid_to ) return false;
      return true;
   }

} } // bead::protocol
