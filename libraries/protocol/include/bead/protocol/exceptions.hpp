#pragma once

#include <fc/exception/exception.hpp>

namespace bead { namespace protocol {

FC_DECLARE_EXCEPTION(         protocol_exception,                                                 40000, "Protocol Exception" );
FC_DECLARE_DERIVED_EXCEPTION( addition_overflow,             bead::protocol::protocol_exception, 40001, "addition overflow" );
FC_DECLARE_DERIVED_EXCEPTION( subtraction_overflow,          bead::protocol::protocol_exception, 40002, "subtraction overflow" );
FC_DECLARE_DERIVED_EXCEPTION( multiplication_overflow,       bead::protocol::protocol_exception, 40003, "multiplication overflow" );
FC_DECLARE_DERIVED_EXCEPTION( negative_quantity,             bead::protocol::protocol_exception, 40004, "negative asset quantity" );
FC_DECLARE_DERIVED_EXCEPTION( unbalanced_transaction,        bead::protocol::protocol_exception, 40005, "unbalanced transaction" );
FC_DECLARE_DERIVED_EXCEPTION( burn_exceeds_holdings,         bead::protocol::protocol_exception, 40006, "burn exceeds holdings" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_tier_table,            bead::protocol::protocol_exception, 40007, "invalid purchase tier table" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_asset_unit,            bead::protocol::protocol_exception, 40008, "invalid asset unit" );

FC_DECLARE_EXCEPTION(         ledger_exception,                                                   41000, "Ledger Exception" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_output,                bead::protocol::ledger_exception,   41001, "unknown output" );
FC_DECLARE_DERIVED_EXCEPTION( duplicate_input,               bead::protocol::ledger_exception,   41002, "duplicate input" );
FC_DECLARE_DERIVED_EXCEPTION( output_below_minimum,          bead::protocol::ledger_exception,   41003, "output below minimum value" );
FC_DECLARE_DERIVED_EXCEPTION( transaction_not_yet_valid,     bead::protocol::ledger_exception,   41004, "transaction not yet valid" );
FC_DECLARE_DERIVED_EXCEPTION( expired_transaction,           bead::protocol::ledger_exception,   41005, "expired transaction" );
FC_DECLARE_DERIVED_EXCEPTION( insufficient_fee,              bead::protocol::ledger_exception,   41006, "insufficient fee" );
FC_DECLARE_DERIVED_EXCEPTION( submission_rejected,           bead::protocol::ledger_exception,   41007, "submission rejected" );
FC_DECLARE_DERIVED_EXCEPTION( ledger_unreachable,            bead::protocol::ledger_exception,   41008, "ledger unreachable" );

} } // bead::protocol
