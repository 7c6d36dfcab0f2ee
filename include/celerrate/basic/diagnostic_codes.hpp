// celerrate/basic/diagnostic_codes.hpp - Stable diagnostic codes
//
// D1xxx  dialect mismatches
// W11xx  forward compatibility
// E2xxx  structural problems in the concrete tree
//
#pragma once

namespace celerrate::diag_code
{

inline constexpr const char * k_construct_unavailable = "D1001";
inline constexpr const char * k_construct_removed = "D1002";
inline constexpr const char * k_dialect_fallback = "D1003";

inline constexpr const char * k_unknown_grammar_kind = "W1101";

inline constexpr const char * k_syntax_error = "E2001";
inline constexpr const char * k_missing_token = "E2002";
inline constexpr const char * k_missing_child = "E2003";
inline constexpr const char * k_nesting_limit = "E2004";
inline constexpr const char * k_malformed_literal = "E2005";
inline constexpr const char * k_unexpected_kind = "E2006";
inline constexpr const char * k_invalid_modifier = "E2007";

}  // namespace celerrate::diag_code
