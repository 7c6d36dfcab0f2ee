// celerrate/syntax/MapSupport.cpp - CST -> AST for literals and names
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <string>

#include <fmt/format.h>

#include "celerrate/basic/diagnostic_codes.hpp"
#include "celerrate/syntax/node_mapper.hpp"

namespace celerrate
{

namespace
{

int digit_value(char c) noexcept
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool is_octal(char c) noexcept { return c >= '0' && c <= '7'; }

void append_utf8(std::string & out, uint32_t cp)
{
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

/// Escapes of double-quoted and heredoc strings. `quote` is '"' for the
/// former and '\0' for heredoc, where `\"` stays as written.
std::string decode_escapes(std::string_view raw, char quote)
{
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c != '\\' || i + 1 >= raw.size()) {
      out.push_back(c);
      continue;
    }

    const char e = raw[i + 1];
    switch (e) {
      case 'n':
        out.push_back('\n');
        ++i;
        continue;
      case 't':
        out.push_back('\t');
        ++i;
        continue;
      case 'r':
        out.push_back('\r');
        ++i;
        continue;
      case 'v':
        out.push_back('\v');
        ++i;
        continue;
      case 'e':
        out.push_back('\x1B');
        ++i;
        continue;
      case 'f':
        out.push_back('\f');
        ++i;
        continue;
      case '\\':
      case '$':
        out.push_back(e);
        ++i;
        continue;
      case '"':
        if (quote == '"') {
          out.push_back('"');
          ++i;
          continue;
        }
        break;
      case 'x':
        if (i + 2 < raw.size() && digit_value(raw[i + 2]) >= 0) {
          int value = digit_value(raw[i + 2]);
          size_t consumed = 2;
          if (i + 3 < raw.size() && digit_value(raw[i + 3]) >= 0) {
            value = value * 16 + digit_value(raw[i + 3]);
            consumed = 3;
          }
          out.push_back(static_cast<char>(value));
          i += consumed;
          continue;
        }
        break;
      case 'u':
        if (i + 2 < raw.size() && raw[i + 2] == '{') {
          const size_t close = raw.find('}', i + 3);
          if (close != std::string_view::npos && close > i + 3) {
            uint32_t cp = 0;
            bool ok = true;
            for (size_t k = i + 3; k < close; ++k) {
              const int d = digit_value(raw[k]);
              // Stop before the accumulator can wrap past U+10FFFF.
              if (d < 0 || cp > 0x10FFFF) {
                ok = false;
                break;
              }
              cp = cp * 16 + static_cast<uint32_t>(d);
            }
            if (ok && cp <= 0x10FFFF) {
              append_utf8(out, cp);
              i = close;
              continue;
            }
          }
        }
        break;
      default:
        if (is_octal(e)) {
          int value = 0;
          size_t k = i + 1;
          for (; k < raw.size() && k < i + 4 && is_octal(raw[k]); ++k) {
            value = value * 8 + (raw[k] - '0');
          }
          out.push_back(static_cast<char>(value & 0xFF));
          i = k - 1;
          continue;
        }
        break;
    }
    // Unknown escapes keep the backslash.
    out.push_back(c);
  }
  return out;
}

std::string decode_single_quoted(std::string_view raw)
{
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] == '\\' && i + 1 < raw.size() && (raw[i + 1] == '\\' || raw[i + 1] == '\'')) {
      out.push_back(raw[i + 1]);
      ++i;
    } else {
      out.push_back(raw[i]);
    }
  }
  return out;
}

/// Raw text of [a, b) with up to `indent` blanks removed after every line start.
std::string strip_indent(
  std::string_view src, uint32_t a, uint32_t b, uint32_t region_begin, uint32_t indent)
{
  if (indent == 0) {
    return std::string(src.substr(a, b - a));
  }
  std::string out;
  uint32_t p = a;
  while (p < b) {
    const bool line_start = p == region_begin || src[p - 1] == '\n';
    if (line_start) {
      uint32_t skipped = 0;
      while (p < b && skipped < indent && (src[p] == ' ' || src[p] == '\t')) {
        ++p;
        ++skipped;
      }
      if (p >= b) break;
    }
    out.push_back(src[p]);
    ++p;
  }
  return out;
}

}  // namespace

// ============================================================================
// Numbers
// ============================================================================

void NodeMapper::report_malformed_literal(ts_ll::Node n, std::string message)
{
  diags_.report_error(span_of(n), std::move(message), "malformed literal")
    .with_code(diag_code::k_malformed_literal);
}

Expr * NodeMapper::map_integer(ts_ll::Node n)
{
  const std::string_view raw = text(n);
  if (raw.find('_') != std::string_view::npos) {
    (void)check_construct(Construct::NumericLiteralSeparator, n);
  }

  std::string digits;
  digits.reserve(raw.size());
  for (const char c : raw) {
    if (c != '_') digits.push_back(c);
  }

  int base = 10;
  size_t pos = 0;
  if (digits.size() > 1 && digits[0] == '0') {
    const char p = static_cast<char>(std::tolower(static_cast<unsigned char>(digits[1])));
    if (p == 'x') {
      base = 16;
      pos = 2;
    } else if (p == 'b') {
      base = 2;
      pos = 2;
    } else if (p == 'o') {
      (void)check_construct(Construct::ExplicitOctalPrefix, n);
      base = 8;
      pos = 2;
    } else {
      base = 8;
      pos = 1;
    }
  }

  if (pos >= digits.size() && base != 10) {
    report_malformed_literal(n, fmt::format("integer literal '{}' has no digits", raw));
    return ast_.create<IntLiteralExpr>(0, span_of(n));
  }

  uint64_t value = 0;
  double approx = 0.0;
  bool overflow = false;
  for (size_t i = pos; i < digits.size(); ++i) {
    const int d = digit_value(digits[i]);
    if (d < 0 || d >= base) {
      report_malformed_literal(
        n, fmt::format("invalid digit '{}' in base-{} integer literal '{}'", digits[i], base, raw));
      return ast_.create<IntLiteralExpr>(0, span_of(n));
    }
    approx = approx * base + d;
    if (!overflow) {
      if (value > (std::numeric_limits<uint64_t>::max() - static_cast<uint64_t>(d)) / base) {
        overflow = true;
      } else {
        value = value * base + static_cast<uint64_t>(d);
      }
    }
  }

  // Integers beyond int64 become floats.
  if (overflow || value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return ast_.create<FloatLiteralExpr>(approx, span_of(n));
  }
  return ast_.create<IntLiteralExpr>(static_cast<int64_t>(value), span_of(n));
}

Expr * NodeMapper::map_float(ts_ll::Node n)
{
  const std::string_view raw = text(n);
  if (raw.find('_') != std::string_view::npos) {
    (void)check_construct(Construct::NumericLiteralSeparator, n);
  }

  std::string digits;
  for (const char c : raw) {
    if (c != '_') digits.push_back(c);
  }

  char * end = nullptr;
  const double value = std::strtod(digits.c_str(), &end);
  if (digits.empty() || end != digits.c_str() + digits.size()) {
    report_malformed_literal(n, fmt::format("malformed floating-point literal '{}'", raw));
  }
  return ast_.create<FloatLiteralExpr>(value, span_of(n));
}

Expr * NodeMapper::map_boolean(ts_ll::Node n)
{
  const std::string_view raw = text(n);
  const bool value = raw.size() == 4 && std::tolower(static_cast<unsigned char>(raw[0])) == 't';
  return ast_.create<BoolLiteralExpr>(value, span_of(n));
}

// ============================================================================
// Strings
// ============================================================================

Expr * NodeMapper::map_string(ts_ll::Node n)
{
  const std::string_view raw = text(n);
  const uint32_t prefix = (!raw.empty() && (raw[0] == 'b' || raw[0] == 'B')) ? 1 : 0;
  if (raw.size() < prefix + 2) {
    report_malformed_literal(n, "unterminated string literal");
    return ast_.create<StringLiteralExpr>(std::string_view{}, span_of(n));
  }

  const uint32_t begin = n.start_byte() + prefix + 1;
  const uint32_t end = n.end_byte() - 1;

  if (raw[prefix] == '"') {
    return map_encapsed(n, StringKind::DoubleQuoted, n, begin, end);
  }

  const std::string value = decode_single_quoted(raw.substr(prefix + 1, raw.size() - prefix - 2));
  auto * lit = ast_.create<StringLiteralExpr>(ast_.intern(value), span_of(n));
  lit->stringKind = StringKind::SingleQuoted;
  return lit;
}

Expr * NodeMapper::map_encapsed(
  ts_ll::Node n, StringKind kind, ts_ll::Node body, uint32_t begin, uint32_t end, uint32_t indent)
{
  const std::string_view src = sm_.get_source();
  const char quote = kind == StringKind::DoubleQuoted ? '"' : '\0';

  std::vector<Expr *> parts;
  std::string pending;
  uint32_t pending_begin = 0;
  uint32_t pending_end = 0;
  bool has_pending = false;
  bool interpolated = false;

  auto add_literal = [&](uint32_t a, uint32_t b) {
    if (a >= b) return;
    if (!has_pending) {
      pending_begin = a;
      has_pending = true;
    }
    pending += strip_indent(src, a, b, begin, indent);
    pending_end = b;
  };
  auto flush = [&]() {
    if (!has_pending) return;
    auto * frag = ast_.create<StringLiteralExpr>(
      ast_.intern(decode_escapes(pending, quote)), tracker_.make_span(pending_begin, pending_end));
    frag->stringKind = kind;
    parts.push_back(frag);
    pending.clear();
    has_pending = false;
  };

  uint32_t pos = begin;
  if (!body.is_null()) {
    const uint32_t count = body.child_count();
    for (uint32_t i = 0; i < count; ++i) {
      const ts_ll::Node c = body.child(i);
      if (c.end_byte() <= begin || c.start_byte() >= end) continue;

      add_literal(pos, std::max(pos, c.start_byte()));
      pos = std::max(pos, c.end_byte());

      if (!c.is_named()) continue;  // quotes and `{` / `}` / `${` delimiters
      switch (classify_grammar_kind(c.kind())) {
        case GrammarKind::StringContent:
        case GrammarKind::EscapeSequence:
        case GrammarKind::Text:
          add_literal(std::max(c.start_byte(), begin), std::min(c.end_byte(), end));
          break;
        case GrammarKind::Comment:
          break;
        default:
          flush();
          interpolated = true;
          parts.push_back(map_expr(c));
          break;
      }
    }
  }
  add_literal(pos, end);

  if (!interpolated) {
    const std::string value = has_pending ? decode_escapes(pending, quote) : std::string();
    auto * lit = ast_.create<StringLiteralExpr>(ast_.intern(value), span_of(n));
    lit->stringKind = kind;
    return lit;
  }

  flush();
  auto * lit = ast_.create<StringLiteralExpr>(
    ast_.intern(src.substr(begin, end - begin)), span_of(n));
  lit->stringKind = kind;
  lit->isInterpolated = true;
  lit->parts = ast_.copy_to_arena(parts);
  return lit;
}

namespace
{

struct HeredocBounds
{
  uint32_t begin;
  uint32_t end;
  uint32_t indent;
};

// Body lies between the line after the opening label and the line of the
// closing label; the closing label's indentation is removed from each line.
HeredocBounds heredoc_bounds(
  std::string_view src, ts_ll::Node n, ts_ll::Node start, ts_ll::Node close)
{
  const uint32_t open_end = start.is_null() ? n.start_byte() : start.end_byte();
  size_t nl = src.find('\n', open_end);
  uint32_t begin = nl == std::string_view::npos || nl >= n.end_byte()
                     ? n.end_byte()
                     : static_cast<uint32_t>(nl + 1);

  uint32_t end = close.is_null() ? n.end_byte() : close.start_byte();
  uint32_t indent = 0;
  if (!close.is_null()) {
    uint32_t line_start = end;
    while (line_start > begin && src[line_start - 1] != '\n') --line_start;
    bool blank = true;
    for (uint32_t p = line_start; p < end; ++p) {
      if (src[p] != ' ' && src[p] != '\t') blank = false;
    }
    if (blank) {
      indent = end - line_start;
      end = line_start;
    }
  }
  // Drop the newline that ends the last body line.
  if (end > begin && src[end - 1] == '\n') --end;
  if (end > begin && src[end - 1] == '\r') --end;
  if (end < begin) end = begin;
  return {begin, end, indent};
}

}  // namespace

Expr * NodeMapper::map_heredoc(ts_ll::Node n)
{
  const HeredocBounds b = heredoc_bounds(
    sm_.get_source(), n, n.first_child_of_kind("heredoc_start"),
    n.first_child_of_kind("heredoc_end"));
  // Some grammar releases put the body parts directly under the heredoc node.
  ts_ll::Node body = n.first_child_of_kind("heredoc_body");
  if (body.is_null()) body = n;
  return map_encapsed(n, StringKind::Heredoc, body, b.begin, b.end, b.indent);
}

Expr * NodeMapper::map_nowdoc(ts_ll::Node n)
{
  const std::string_view src = sm_.get_source();
  const HeredocBounds b = heredoc_bounds(
    src, n, n.first_child_of_kind("heredoc_start"), n.first_child_of_kind("heredoc_end"));

  const std::string value = strip_indent(src, b.begin, b.end, b.begin, b.indent);
  auto * lit = ast_.create<StringLiteralExpr>(ast_.intern(value), span_of(n));
  lit->stringKind = StringKind::Nowdoc;
  return lit;
}

// ============================================================================
// Names
// ============================================================================

std::string_view NodeMapper::qualified_text(ts_ll::Node n, NameKind & kind)
{
  std::string name;
  for (const char c : text(n)) {
    if (!std::isspace(static_cast<unsigned char>(c))) name.push_back(c);
  }

  kind = NameKind::Unqualified;
  if (!name.empty() && name.front() == '\\') {
    kind = NameKind::FullyQualified;
    name.erase(0, 1);
  } else if (
    name.size() > 10 && name[9] == '\\' &&
    std::equal(name.begin(), name.begin() + 9, "namespace", [](char a, char b) {
      return std::tolower(static_cast<unsigned char>(a)) == b;
    })) {
    kind = NameKind::Relative;
    name.erase(0, 10);
  } else if (name.find('\\') != std::string::npos) {
    kind = NameKind::Qualified;
  }
  return ast_.intern(name);
}

}  // namespace celerrate
