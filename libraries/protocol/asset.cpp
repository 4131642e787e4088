#include <bead/protocol/asset.hpp>
#include <bead/protocol/config.hpp>
#include <bead/protocol/exceptions.hpp>

#include <fc/reflect/variant.hpp>
#include <fc/uint128.hpp>

namespace bead { namespace protocol {

  const asset_unit_type& native_unit()
  {
     static const asset_unit_type unit( BEAD_NATIVE_UNIT );
     return unit;
  }

  asset_unit_type make_unit( const policy_id_type& policy, const string& name )
  { try {
     FC_ASSERT( !policy.empty(), "token units need a policy id" );
     FC_ASSERT( policy.find( '.' ) == string::npos, "policy id may not contain '.'" );
     return policy + "." + name;
  } FC_CAPTURE_AND_RETHROW( (policy)(name) ) }

  policy_id_type unit_policy( const asset_unit_type& unit )
  {
     auto pos = unit.find( '.' );
     if( pos == string::npos ) return policy_id_type();
     return unit.substr( 0, pos );
  }

  string unit_name( const asset_unit_type& unit )
  {
     auto pos = unit.find( '.' );
     if( pos == string::npos ) return unit;
     return unit.substr( pos + 1 );
  }

  share_type checked_add( share_type a, share_type b )
  {
     if( ((b > 0) && (a > (INT64_MAX - b))) ||
         ((b < 0) && (a < (INT64_MIN - b))) )
     {
        FC_THROW_EXCEPTION( addition_overflow, "asset addition overflow  ${a} + ${b}", ("a",a)("b",b) );
     }
     return a + b;
  }

  share_type checked_sub( share_type a, share_type b )
  {
     if( ((b > 0) && (a < (INT64_MIN + b))) ||
         ((b < 0) && (a > (INT64_MAX + b))) )
     {
        FC_THROW_EXCEPTION( subtraction_overflow, "asset subtraction overflow  ${a} - ${b}", ("a",a)("b",b) );
     }
     return a - b;
  }

  share_type checked_mul( share_type a, share_type b )
  {
     bool overflow = a > 0 ? ( b > 0 ? a > INT64_MAX / b : b < INT64_MIN / a )
                           : ( b > 0 ? a < INT64_MIN / b : ( a != 0 && b < INT64_MAX / a ) );
     if( overflow )
        FC_THROW_EXCEPTION( multiplication_overflow, "asset multiplication overflow  ${a} * ${b}", ("a",a)("b",b) );
     return a * b;
  }

  share_type mul_div( share_type a, share_type b, share_type c )
  { try {
     FC_ASSERT( a >= 0 && b >= 0 );
     FC_ASSERT( c > 0, "division by a non-positive quantity" );

     fc::uint128 product( uint64_t( a ) );
     product *= fc::uint128( uint64_t( b ) );
     product /= fc::uint128( uint64_t( c ) );

     if( product > fc::uint128( uint64_t( INT64_MAX ) ) )
        FC_THROW_EXCEPTION( multiplication_overflow, "${a} * ${b} / ${c} does not fit a share", ("a",a)("b",b)("c",c) );

     return share_type( product.to_uint64() );
  } FC_CAPTURE_AND_RETHROW( (a)(b)(c) ) }

  asset& asset::operator += ( const asset& o )
  { try {
     FC_ASSERT( unit == o.unit, "", ("*this",*this)("o",o) );
     amount = checked_add( amount, o.amount );
     return *this;
  } FC_CAPTURE_AND_RETHROW( (*this)(o) ) }

  asset& asset::operator -= ( const asset& o )
  { try {
     FC_ASSERT( unit == o.unit, "", ("*this",*this)("o",o) );
     amount = checked_sub( amount, o.amount );
     return *this;
  } FC_CAPTURE_AND_RETHROW( (*this)(o) ) }

  asset operator + ( const asset& l, const asset& r )
  {
     asset tmp( l );
     tmp += r;
     return tmp;
  }

  asset operator - ( const asset& l, const asset& r )
  {
     asset tmp( l );
     tmp -= r;
     return tmp;
  }

  share_type native_amount( const asset_map& assets )
  {
     return quantity_of( assets, native_unit() );
  }

  share_type quantity_of( const asset_map& assets, const asset_unit_type& unit )
  {
     auto itr = assets.find( unit );
     if( itr == assets.end() ) return 0;
     return itr->second;
  }

  bool has_tokens( const asset_map& assets )
  {
     for( const auto& item : assets )
        if( item.first != native_unit() && item.second != 0 )
           return true;
     return false;
  }

  void add_to( asset_map& target, const asset_map& source )
  {
     for( const auto& item : source )
        target[item.first] = checked_add( target[item.first], item.second );
  }

  void add_to( asset_map& target, const asset& a )
  {
     target[a.unit] = checked_add( target[a.unit], a.amount );
  }

  asset_map normalized( const asset_map& assets )
  {
     asset_map result;
     result[native_unit()] = native_amount( assets );
     for( const auto& item : assets )
        if( item.second != 0 )
           result[item.first] = item.second;
     return result;
  }

} } // bead::protocol
