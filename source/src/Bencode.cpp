#include <Bencode.hpp>

#include <cctype>
#include <limits>

namespace {

constexpr size_t max_depth = 256;

bool all_digits(const std::string& s, size_t from = 0) {
    if (s.size() <= from) return false;
    for (size_t i = from; i < s.size(); ++i)
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    return true;
}

}

BEncodeParser::BEncodeParser(const std::string& input) : _data(input), pos(0) {}

BEncodeValue BEncodeParser::parse() {
    auto value = parse_value();
    if (pos != _data.size()) {
        throw DecodeError("trailing data after top-level value at offset " + std::to_string(pos));
    }
    return value;
}

BEncodeValue BEncodeParser::parse_value() {
    if (pos >= _data.size()) {
        throw DecodeError("unexpected end of input");
    }

    char c = _data[pos];

    if (c == 'i') {
        return BEncodeValue{ parse_int() };
    }
    else if (c == 'l' || c == 'd') {
        if (++depth > max_depth) throw DecodeError("nesting too deep");
        ++pos;  // skip 'l' / 'd'
        BEncodeValue v = (c == 'l') ? BEncodeValue{ parse_list() } : BEncodeValue{ parse_dict() };
        --depth;
        return v;
    }
    else if (std::isdigit(static_cast<unsigned char>(c))) {
        return BEncodeValue{ parse_string() };
    }
    else {
        throw DecodeError(std::string("invalid token '") + c + "' at offset " + std::to_string(pos));
    }
}

int64_t BEncodeParser::parse_int() {
    ++pos;  // skip 'i'

    size_t end = _data.find('e', pos);
    if (end == std::string::npos) throw DecodeError("missing 'e' for integer");

    std::string number = _data.substr(pos, end - pos);
    pos = end + 1;  // move past 'e'

    bool negative = !number.empty() && number[0] == '-';
    size_t first = negative ? 1 : 0;

    if (!all_digits(number, first)) throw DecodeError("malformed integer '" + number + "'");
    if (number.size() - first > 1 && number[first] == '0') throw DecodeError("leading zero in integer");
    if (negative && number[first] == '0') throw DecodeError("negative zero");

    try {
        return std::stoll(number);
    } catch (const std::out_of_range&) {
        throw DecodeError("integer out of range");
    }
}

std::string BEncodeParser::parse_string() {
    size_t colon = _data.find(':', pos);
    if (colon == std::string::npos) throw DecodeError("missing ':' in string");

    std::string len_str = _data.substr(pos, colon - pos);
    if (!all_digits(len_str)) throw DecodeError("malformed string length");
    if (len_str.size() > 1 && len_str[0] == '0') throw DecodeError("leading zero in string length");
    if (len_str.size() > 18) throw DecodeError("string length out of range");

    size_t len = std::stoull(len_str);

    pos = colon + 1;  // skip ':'

    if (len > _data.size() - pos) throw DecodeError("string length exceeds input");

    std::string result = _data.substr(pos, len);
    pos += len;  // advance past the string

    return result;
}

BEncodeValue::List BEncodeParser::parse_list() {
    BEncodeValue::List list;
    while (pos < _data.size() && _data[pos] != 'e') {
        list.push_back(parse_value());
    }
    if (pos >= _data.size()) throw DecodeError("missing 'e' at end of list");
    ++pos;  // skip 'e'
    return list;
}

BEncodeValue::Dict BEncodeParser::parse_dict() {
    BEncodeValue::Dict dict;
    while (pos < _data.size() && _data[pos] != 'e') {
        if (!std::isdigit(static_cast<unsigned char>(_data[pos]))) throw DecodeError("dictionary key is not a string");

        std::string key = parse_string();
        size_t val_start = pos;
        BEncodeValue value = parse_value();
        size_t val_end = pos;

        // only the top-level dictionary owns the info value
        if (depth == 1 && key == "info") {
            _info_start = val_start;
            _info_end = val_end;
        }
        if (!dict.emplace(std::move(key), std::move(value)).second) throw DecodeError("duplicate dictionary key");
    }
    if (pos >= _data.size()) throw DecodeError("missing 'e' at end of dict");
    ++pos;  // skip 'e'
    return dict;
}

void bencode(const BEncodeValue& value, std::string& out) {
    if (value.is_int()) {
        out += 'i';
        out += std::to_string(value.as_int());
        out += 'e';
    }
    else if (value.is_string()) {
        const auto& s = value.as_string();
        out += std::to_string(s.size());
        out += ':';
        out += s;
    }
    else if (value.is_list()) {
        out += 'l';
        for (const auto& item : value.as_list()) bencode(item, out);
        out += 'e';
    }
    else {
        out += 'd';
        for (const auto& [key, item] : value.as_dict()) {
            out += std::to_string(key.size());
            out += ':';
            out += key;
            bencode(item, out);
        }
        out += 'e';
    }
}

std::string bencode(const BEncodeValue& value) {
    std::string out;
    bencode(value, out);
    return out;
}
