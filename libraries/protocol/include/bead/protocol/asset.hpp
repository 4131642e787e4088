#pragma once

#include <bead/protocol/types.hpp>

namespace bead { namespace protocol {

  /** Quantities per asset unit; the native unit is always present on ledger outputs */
  typedef map<asset_unit_type, share_type> asset_map;

  const asset_unit_type& native_unit();

  /** Unit identifier for a token: <policy>.<name> */
  asset_unit_type make_unit( const policy_id_type& policy, const string& name );
  policy_id_type  unit_policy( const asset_unit_type& unit );
  string          unit_name( const asset_unit_type& unit );

  /**
   *  A signed quantity of a single unit.  Positive amounts are holdings or mints,
   *  negative amounts are burns.
   */
  struct asset
  {
      asset():amount(0),unit(native_unit()){}
      explicit asset( share_type a, const asset_unit_type& u = native_unit() )
      :amount(a),unit(u){}

      asset& operator += ( const asset& o );
      asset& operator -= ( const asset& o );
      asset operator-()const { return asset( -amount, unit ); }

      bool is_native()const { return unit == native_unit(); }

      share_type       amount;
      asset_unit_type  unit;
  };

  inline bool operator == ( const asset& l, const asset& r )
  {
      return std::tie( l.amount, l.unit ) == std::tie( r.amount, r.unit );
  }
  inline bool operator != ( const asset& l, const asset& r )
  {
      return !( l == r );
  }

  asset operator + ( const asset& l, const asset& r );
  asset operator - ( const asset& l, const asset& r );

  /** Overflow checked helpers */
  share_type checked_add( share_type a, share_type b );
  share_type checked_sub( share_type a, share_type b );
  share_type checked_mul( share_type a, share_type b );

  /** floor( a * b / c ) in 128 bits; c must be positive */
  share_type mul_div( share_type a, share_type b, share_type c );

  share_type native_amount( const asset_map& assets );
  share_type quantity_of( const asset_map& assets, const asset_unit_type& unit );
  bool       has_tokens( const asset_map& assets );

  void add_to( asset_map& target, const asset_map& source );
  void add_to( asset_map& target, const asset& a );

  /** Drops zero entries, except the native unit */
  asset_map normalized( const asset_map& assets );

} } // bead::protocol

FC_REFLECT( bead::protocol::asset, (amount)(unit) )
