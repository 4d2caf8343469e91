#include "path_codec.hpp"

#include <cctype>
#include <cstddef>

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";
constexpr const char* kReplacementChar = "\xEF\xBF\xBD";

bool needs_escape(unsigned char ch) {
  return ch < 0x20 || ch == ' ' || ch == '%' || ch >= 0x7F;
}

int hex_value(char ch) {
  if(ch >= '0' && ch <= '9') return ch - '0';
  if(ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  if(ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  return -1;
}

// Length of the valid UTF-8 sequence starting at pos, or 0 when invalid.
std::size_t utf8_sequence_length(const std::string& s, std::size_t pos) {
  auto byte = [&](std::size_t i){ return static_cast<unsigned char>(s[i]); };
  auto continuation = [&](std::size_t i){
    return i < s.size() && (byte(i) & 0xC0) == 0x80;
  };

  unsigned char lead = byte(pos);
  if(lead < 0x80) return 1;
  if(lead >= 0xC2 && lead <= 0xDF) {
    return continuation(pos + 1) ? 2 : 0;
  }
  if(lead >= 0xE0 && lead <= 0xEF) {
    if(!continuation(pos + 1) || !continuation(pos + 2)) return 0;
    unsigned char second = byte(pos + 1);
    if(lead == 0xE0 && second < 0xA0) return 0;   // overlong
    if(lead == 0xED && second >= 0xA0) return 0;  // surrogates
    return 3;
  }
  if(lead >= 0xF0 && lead <= 0xF4) {
    if(!continuation(pos + 1) || !continuation(pos + 2) || !continuation(pos + 3)) return 0;
    unsigned char second = byte(pos + 1);
    if(lead == 0xF0 && second < 0x90) return 0;
    if(lead == 0xF4 && second >= 0x90) return 0;
    return 4;
  }
  return 0;
}

} // namespace

std::string encode_arg(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for(char c : raw) {
    auto ch = static_cast<unsigned char>(c);
    if(needs_escape(ch)) {
      out.push_back('%');
      out.push_back(kHexDigits[ch >> 4]);
      out.push_back(kHexDigits[ch & 0x0F]);
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string sanitize_utf8(const std::string& bytes) {
  std::string out;
  out.reserve(bytes.size());
  std::size_t pos = 0;
  while(pos < bytes.size()) {
    std::size_t len = utf8_sequence_length(bytes, pos);
    if(len == 0) {
      out += kReplacementChar;
      ++pos;
      continue;
    }
    out.append(bytes, pos, len);
    pos += len;
  }
  return out;
}

std::string decode_arg(const std::string& encoded) {
  std::string bytes;
  bytes.reserve(encoded.size());
  for(std::size_t i = 0; i < encoded.size(); ++i) {
    char c = encoded[i];
    if(c == '%' && i + 2 < encoded.size()) {
      int hi = hex_value(encoded[i + 1]);
      int lo = hex_value(encoded[i + 2]);
      if(hi >= 0 && lo >= 0) {
        bytes.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    bytes.push_back(c);
  }
  return sanitize_utf8(bytes);
}

ParsedCommand parse_command(const std::string& line) {
  ParsedCommand cmd;
  std::size_t pos = 0;
  bool first = true;
  while(pos < line.size()) {
    while(pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
    if(pos >= line.size()) break;
    std::size_t end = pos;
    while(end < line.size() && !std::isspace(static_cast<unsigned char>(line[end]))) ++end;
    std::string word = line.substr(pos, end - pos);
    if(first) {
      cmd.name = std::move(word);
      first = false;
    } else {
      cmd.args.push_back(decode_arg(word));
    }
    pos = end;
  }
  return cmd;
}

std::string format_command(const std::string& name,
                           const std::vector<std::string>& args) {
  std::string out = name;
  for(const auto& arg : args) {
    out += ' ';
    out += encode_arg(arg);
  }
  out += '\n';
  return out;
}
