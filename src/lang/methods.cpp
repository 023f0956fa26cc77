#include "lang/methods.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <numeric>
#include <unordered_map>

#include "lang/interpreter.hpp"
#include "lang/operators.hpp"
#include "lang/script_error.hpp"

namespace evalbox::lang {
namespace {

using Method = Value (*)(Interpreter&, const Value&, CallArguments&);
using MethodTable = std::unordered_map<std::string, Method>;

bool IsSpace(char32_t ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

bool IsAsciiAlpha(char32_t ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

bool IsAsciiDigit(char32_t ch) {
    return ch >= '0' && ch <= '9';
}

char32_t ToUpper(char32_t ch) {
    return (ch >= 'a' && ch <= 'z') ? ch - 32 : ch;
}

char32_t ToLower(char32_t ch) {
    return (ch >= 'A' && ch <= 'Z') ? ch + 32 : ch;
}

std::string MapChars(const std::string& text, char32_t (*fn)(char32_t)) {
    std::string out = text;
    for (auto& ch : out) {
        const auto byte = static_cast<unsigned char>(ch);
        if (byte < 0x80) {
            ch = static_cast<char>(fn(byte));
        }
    }
    return out;
}

Value MakeView(const std::string& type_name, std::vector<Value> snapshot) {
    auto view = std::make_shared<IteratorObject>();
    view->type_name = type_name;
    view->is_view = true;
    view->snapshot = std::move(snapshot);
    return Value::FromObject(ValueKind::kIterator, std::move(view));
}

std::int64_t ClampIndex(std::int64_t index, std::int64_t length) {
    if (index < 0) {
        index += length;
        return index < 0 ? 0 : index;
    }
    return index > length ? length : index;
}

// Resolves the optional (start, end) arguments of find/count/startswith
// against a code point sequence.
void ResolveRange(const CallArguments& args, std::size_t first, std::int64_t length, std::int64_t& start,
                  std::int64_t& end) {
    start = 0;
    end = length;
    if (args.positional.size() > first && !args.positional[first].IsNone()) {
        start = ClampIndex(RequireInt(args.positional[first]), length);
    }
    if (args.positional.size() > first + 1 && !args.positional[first + 1].IsNone()) {
        end = ClampIndex(RequireInt(args.positional[first + 1]), length);
    }
}

// Index of needle in haystack[start:end] in code points, or -1.
std::int64_t FindCodePoints(const std::u32string& haystack, const std::u32string& needle, std::int64_t start,
                            std::int64_t end, bool reverse) {
    if (end < start || static_cast<std::int64_t>(needle.size()) > end - start) {
        return -1;
    }
    const auto window = haystack.substr(static_cast<std::size_t>(start), static_cast<std::size_t>(end - start));
    const auto found = reverse ? window.rfind(needle) : window.find(needle);
    return found == std::u32string::npos ? -1 : start + static_cast<std::int64_t>(found);
}

std::u32string StripChars(const CallArguments& args, const std::string& name) {
    CheckArity(name, args, 0, 1);
    if (args.positional.empty() || args.positional[0].IsNone()) {
        return U" \t\n\r\v\f";
    }
    return DecodeUtf8(RequireStr(args.positional[0], name + " arg"));
}

Value Strip(const Value& self, CallArguments& args, const std::string& name, bool left, bool right) {
    const auto chars = StripChars(args, name);
    const auto text = DecodeUtf8(self.AsStr());
    std::size_t begin = 0;
    std::size_t end = text.size();
    if (left) {
        while (begin < end && chars.find(text[begin]) != std::u32string::npos) {
            ++begin;
        }
    }
    if (right) {
        while (end > begin && chars.find(text[end - 1]) != std::u32string::npos) {
            --end;
        }
    }
    return Value::Str(EncodeUtf8(text.substr(begin, end - begin)));
}

std::vector<Value> SplitWhitespace(const std::string& text, std::int64_t max_split, bool reverse) {
    std::vector<std::string> parts;
    const auto chars = DecodeUtf8(text);
    if (!reverse) {
        std::size_t i = 0;
        while (i < chars.size()) {
            while (i < chars.size() && IsSpace(chars[i])) {
                ++i;
            }
            if (i >= chars.size()) {
                break;
            }
            if (max_split >= 0 && static_cast<std::int64_t>(parts.size()) == max_split) {
                std::size_t end = chars.size();
                while (end > i && IsSpace(chars[end - 1])) {
                    --end;
                }
                parts.push_back(EncodeUtf8(chars.substr(i, end - i)));
                break;
            }
            const std::size_t start = i;
            while (i < chars.size() && !IsSpace(chars[i])) {
                ++i;
            }
            parts.push_back(EncodeUtf8(chars.substr(start, i - start)));
        }
    } else {
        std::size_t i = chars.size();
        while (i > 0) {
            while (i > 0 && IsSpace(chars[i - 1])) {
                --i;
            }
            if (i == 0) {
                break;
            }
            if (max_split >= 0 && static_cast<std::int64_t>(parts.size()) == max_split) {
                std::size_t begin = 0;
                while (begin < i && IsSpace(chars[begin])) {
                    ++begin;
                }
                parts.push_back(EncodeUtf8(chars.substr(begin, i - begin)));
                break;
            }
            const std::size_t end = i;
            while (i > 0 && !IsSpace(chars[i - 1])) {
                --i;
            }
            parts.push_back(EncodeUtf8(chars.substr(i, end - i)));
        }
        std::reverse(parts.begin(), parts.end());
    }
    std::vector<Value> out;
    out.reserve(parts.size());
    for (auto& part : parts) {
        out.push_back(Value::Str(std::move(part)));
    }
    return out;
}

std::vector<Value> SplitSeparator(const std::string& text, const std::string& sep, std::int64_t max_split,
                                  bool reverse) {
    std::vector<std::string> parts;
    if (!reverse) {
        std::size_t start = 0;
        while (max_split < 0 || static_cast<std::int64_t>(parts.size()) < max_split) {
            const auto found = text.find(sep, start);
            if (found == std::string::npos) {
                break;
            }
            parts.push_back(text.substr(start, found - start));
            start = found + sep.size();
        }
        parts.push_back(text.substr(start));
    } else {
        std::size_t end = text.size();
        while (max_split < 0 || static_cast<std::int64_t>(parts.size()) < max_split) {
            if (end < sep.size()) {
                break;
            }
            const auto found = text.rfind(sep, end - sep.size());
            if (found == std::string::npos) {
                break;
            }
            parts.push_back(text.substr(found + sep.size(), end - found - sep.size()));
            end = found;
        }
        parts.push_back(text.substr(0, end));
        std::reverse(parts.begin(), parts.end());
    }
    std::vector<Value> out;
    out.reserve(parts.size());
    for (auto& part : parts) {
        out.push_back(Value::Str(std::move(part)));
    }
    return out;
}

Value Split(Interpreter& interpreter, const Value& self, CallArguments& args, const std::string& name,
            bool reverse) {
    CheckKeywords(name, args, {"sep", "maxsplit"});
    if (args.positional.size() > 2) {
        ThrowError("TypeError", name + "() takes at most 2 arguments (" + std::to_string(args.positional.size()) +
                                    " given)");
    }
    const Value* sep = Argument(args, 0, "sep");
    const Value* max_split = Argument(args, 1, "maxsplit");
    const std::int64_t limit = max_split != nullptr ? RequireInt(*max_split) : -1;
    std::vector<Value> parts;
    if (sep == nullptr || sep->IsNone()) {
        parts = SplitWhitespace(self.AsStr(), limit, reverse);
    } else {
        const auto& separator = RequireStr(*sep, "must be str or None");
        if (separator.empty()) {
            ThrowError("ValueError", "empty separator");
        }
        parts = SplitSeparator(self.AsStr(), separator, limit, reverse);
    }
    interpreter.CheckContainerSize(parts.size());
    return Value::List(std::move(parts));
}

Value Justify(const Value& self, CallArguments& args, const std::string& name, char align) {
    CheckArity(name, args, 1, 2);
    const auto width = RequireInt(args.positional[0]);
    char32_t fill = U' ';
    if (args.positional.size() > 1) {
        const auto fill_text = DecodeUtf8(RequireStr(args.positional[1], name + "() argument 2"));
        if (fill_text.size() != 1) {
            ThrowError("TypeError", "The fill character must be exactly one character long");
        }
        fill = fill_text[0];
    }
    const auto text = DecodeUtf8(self.AsStr());
    const auto length = static_cast<std::int64_t>(text.size());
    if (width <= length) {
        return self;
    }
    const auto padding = static_cast<std::size_t>(width - length);
    std::size_t left = 0;
    if (align == '>') {
        left = padding;
    } else if (align == '^') {
        left = padding / 2 + (padding & static_cast<std::size_t>(width) & 1);
    }
    const std::size_t right = padding - left;
    return Value::Str(EncodeUtf8(std::u32string(left, fill) + text + std::u32string(right, fill)));
}

Value FindLike(const Value& self, CallArguments& args, const std::string& name, bool reverse, bool raise) {
    CheckArity(name, args, 1, 3);
    const auto text = DecodeUtf8(self.AsStr());
    const auto needle = DecodeUtf8(RequireStr(args.positional[0], "must be str"));
    std::int64_t start = 0;
    std::int64_t end = 0;
    ResolveRange(args, 1, static_cast<std::int64_t>(text.size()), start, end);
    const auto found = FindCodePoints(text, needle, start, end, reverse);
    if (found < 0 && raise) {
        ThrowError("ValueError", "substring not found");
    }
    return Value::Int(found);
}

Value AffixTest(const Value& self, CallArguments& args, const std::string& name, bool prefix) {
    CheckArity(name, args, 1, 3);
    const auto text = DecodeUtf8(self.AsStr());
    std::int64_t start = 0;
    std::int64_t end = 0;
    ResolveRange(args, 1, static_cast<std::int64_t>(text.size()), start, end);
    const auto window = end >= start ? text.substr(static_cast<std::size_t>(start), static_cast<std::size_t>(end - start))
                                     : std::u32string();
    std::vector<Value> candidates;
    const auto& subject = args.positional[0];
    if (subject.kind() == ValueKind::kTuple) {
        candidates = subject.AsTuple()->items;
    } else if (subject.IsStr()) {
        candidates.push_back(subject);
    } else {
        ThrowError("TypeError", name + " first arg must be str or a tuple of str, not " + TypeName(subject));
    }
    for (const auto& candidate : candidates) {
        const auto affix = DecodeUtf8(RequireStr(candidate, "tuple for " + name + " must only contain str"));
        if (affix.size() > window.size()) {
            continue;
        }
        if (prefix ? window.compare(0, affix.size(), affix) == 0
                   : window.compare(window.size() - affix.size(), affix.size(), affix) == 0) {
            return Value::Bool(true);
        }
    }
    return Value::Bool(false);
}

template <typename Predicate>
Value CharacterTest(const Value& self, CallArguments& args, const std::string& name, Predicate predicate) {
    CheckArity(name, args, 0, 0);
    const auto text = DecodeUtf8(self.AsStr());
    if (text.empty()) {
        return Value::Bool(false);
    }
    return Value::Bool(std::all_of(text.begin(), text.end(), predicate));
}

Value CaseTest(const Value& self, CallArguments& args, const std::string& name, bool upper) {
    CheckArity(name, args, 0, 0);
    bool cased = false;
    for (const char ch : self.AsStr()) {
        if (ch >= 'a' && ch <= 'z') {
            if (upper) {
                return Value::Bool(false);
            }
            cased = true;
        } else if (ch >= 'A' && ch <= 'Z') {
            if (!upper) {
                return Value::Bool(false);
            }
            cased = true;
        }
    }
    return Value::Bool(cased);
}

const MethodTable& StrMethods() {
    static const MethodTable kMethods = {
        {"upper", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("upper", args, 0, 0);
             return Value::Str(MapChars(self.AsStr(), ToUpper));
         }},
        {"lower", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("lower", args, 0, 0);
             return Value::Str(MapChars(self.AsStr(), ToLower));
         }},
        {"casefold", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("casefold", args, 0, 0);
             return Value::Str(MapChars(self.AsStr(), ToLower));
         }},
        {"swapcase", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("swapcase", args, 0, 0);
             return Value::Str(MapChars(self.AsStr(), [](char32_t ch) {
                 return ch >= 'a' && ch <= 'z' ? ToUpper(ch) : ToLower(ch);
             }));
         }},
        {"capitalize", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("capitalize", args, 0, 0);
             auto out = MapChars(self.AsStr(), ToLower);
             if (!out.empty() && static_cast<unsigned char>(out[0]) < 0x80) {
                 out[0] = static_cast<char>(ToUpper(static_cast<unsigned char>(out[0])));
             }
             return Value::Str(std::move(out));
         }},
        {"title", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("title", args, 0, 0);
             std::string out = self.AsStr();
             bool previous_cased = false;
             for (auto& ch : out) {
                 const auto byte = static_cast<unsigned char>(ch);
                 if (IsAsciiAlpha(byte)) {
                     ch = static_cast<char>(previous_cased ? ToLower(byte) : ToUpper(byte));
                     previous_cased = true;
                 } else {
                     previous_cased = false;
                 }
             }
             return Value::Str(std::move(out));
         }},
        {"strip", [](Interpreter&, const Value& self, CallArguments& args) {
             return Strip(self, args, "strip", true, true);
         }},
        {"lstrip", [](Interpreter&, const Value& self, CallArguments& args) {
             return Strip(self, args, "lstrip", true, false);
         }},
        {"rstrip", [](Interpreter&, const Value& self, CallArguments& args) {
             return Strip(self, args, "rstrip", false, true);
         }},
        {"split", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             return Split(interpreter, self, args, "split", false);
         }},
        {"rsplit", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             return Split(interpreter, self, args, "rsplit", true);
         }},
        {"splitlines", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckKeywords("splitlines", args, {"keepends"});
             const Value* keep = Argument(args, 0, "keepends");
             const bool keep_ends = keep != nullptr && Truthy(*keep);
             const auto& text = self.AsStr();
             std::vector<Value> lines;
             std::size_t start = 0;
             std::size_t i = 0;
             while (i < text.size()) {
                 if (text[i] == '\n' || text[i] == '\r') {
                     std::size_t end = i;
                     if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                         ++i;
                     }
                     ++i;
                     lines.push_back(Value::Str(text.substr(start, (keep_ends ? i : end) - start)));
                     start = i;
                 } else {
                     ++i;
                 }
             }
             if (start < text.size()) {
                 lines.push_back(Value::Str(text.substr(start)));
             }
             return Value::List(std::move(lines));
         }},
        {"join", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckArity("join", args, 1, 1);
             const auto items = interpreter.Materialize(args.positional[0]);
             std::string out;
             for (std::size_t i = 0; i < items.size(); ++i) {
                 if (!items[i].IsStr()) {
                     ThrowError("TypeError", "sequence item " + std::to_string(i) + ": expected str instance, " +
                                                 TypeName(items[i]) + " found");
                 }
                 if (i > 0) {
                     out += self.AsStr();
                 }
                 out += items[i].AsStr();
                 interpreter.CheckContainerSize(out.size());
             }
             return Value::Str(std::move(out));
         }},
        {"replace", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckArity("replace", args, 2, 3);
             const auto& old_text = RequireStr(args.positional[0], "replace() argument 1 must be str");
             const auto& new_text = RequireStr(args.positional[1], "replace() argument 2 must be str");
             std::int64_t count = args.positional.size() > 2 ? RequireInt(args.positional[2]) : -1;
             const auto& text = self.AsStr();
             std::string out;
             if (old_text.empty()) {
                 const auto chars = DecodeUtf8(text);
                 for (std::size_t i = 0; i <= chars.size(); ++i) {
                     if (count != 0) {
                         out += new_text;
                         if (count > 0) {
                             --count;
                         }
                     }
                     if (i < chars.size()) {
                         out += EncodeUtf8(chars[i]);
                     }
                     interpreter.CheckContainerSize(out.size());
                 }
                 return Value::Str(std::move(out));
             }
             std::size_t start = 0;
             while (count != 0) {
                 const auto found = text.find(old_text, start);
                 if (found == std::string::npos) {
                     break;
                 }
                 out.append(text, start, found - start);
                 out += new_text;
                 interpreter.CheckContainerSize(out.size());
                 start = found + old_text.size();
                 if (count > 0) {
                     --count;
                 }
             }
             out.append(text, start, std::string::npos);
             return Value::Str(std::move(out));
         }},
        {"startswith", [](Interpreter&, const Value& self, CallArguments& args) {
             return AffixTest(self, args, "startswith", true);
         }},
        {"endswith", [](Interpreter&, const Value& self, CallArguments& args) {
             return AffixTest(self, args, "endswith", false);
         }},
        {"find", [](Interpreter&, const Value& self, CallArguments& args) {
             return FindLike(self, args, "find", false, false);
         }},
        {"rfind", [](Interpreter&, const Value& self, CallArguments& args) {
             return FindLike(self, args, "rfind", true, false);
         }},
        {"index", [](Interpreter&, const Value& self, CallArguments& args) {
             return FindLike(self, args, "index", false, true);
         }},
        {"rindex", [](Interpreter&, const Value& self, CallArguments& args) {
             return FindLike(self, args, "rindex", true, true);
         }},
        {"count", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("count", args, 1, 3);
             const auto text = DecodeUtf8(self.AsStr());
             const auto needle = DecodeUtf8(RequireStr(args.positional[0], "must be str"));
             std::int64_t start = 0;
             std::int64_t end = 0;
             ResolveRange(args, 1, static_cast<std::int64_t>(text.size()), start, end);
             if (end < start) {
                 return Value::Int(0);
             }
             if (needle.empty()) {
                 return Value::Int(end - start + 1);
             }
             std::int64_t count = 0;
             auto position = start;
             while (true) {
                 const auto found = FindCodePoints(text, needle, position, end, false);
                 if (found < 0) {
                     break;
                 }
                 ++count;
                 position = found + static_cast<std::int64_t>(needle.size());
             }
             return Value::Int(count);
         }},
        {"isdigit", [](Interpreter&, const Value& self, CallArguments& args) {
             return CharacterTest(self, args, "isdigit", IsAsciiDigit);
         }},
        {"isdecimal", [](Interpreter&, const Value& self, CallArguments& args) {
             return CharacterTest(self, args, "isdecimal", IsAsciiDigit);
         }},
        {"isnumeric", [](Interpreter&, const Value& self, CallArguments& args) {
             return CharacterTest(self, args, "isnumeric", IsAsciiDigit);
         }},
        {"isalpha", [](Interpreter&, const Value& self, CallArguments& args) {
             return CharacterTest(self, args, "isalpha", IsAsciiAlpha);
         }},
        {"isalnum", [](Interpreter&, const Value& self, CallArguments& args) {
             return CharacterTest(self, args, "isalnum",
                                  [](char32_t ch) { return IsAsciiAlpha(ch) || IsAsciiDigit(ch); });
         }},
        {"isspace", [](Interpreter&, const Value& self, CallArguments& args) {
             return CharacterTest(self, args, "isspace", IsSpace);
         }},
        {"isupper", [](Interpreter&, const Value& self, CallArguments& args) {
             return CaseTest(self, args, "isupper", true);
         }},
        {"islower", [](Interpreter&, const Value& self, CallArguments& args) {
             return CaseTest(self, args, "islower", false);
         }},
        {"center", [](Interpreter&, const Value& self, CallArguments& args) {
             return Justify(self, args, "center", '^');
         }},
        {"ljust", [](Interpreter&, const Value& self, CallArguments& args) {
             return Justify(self, args, "ljust", '<');
         }},
        {"rjust", [](Interpreter&, const Value& self, CallArguments& args) {
             return Justify(self, args, "rjust", '>');
         }},
        {"zfill", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("zfill", args, 1, 1);
             const auto width = RequireInt(args.positional[0]);
             const auto text = DecodeUtf8(self.AsStr());
             const auto length = static_cast<std::int64_t>(text.size());
             if (width <= length) {
                 return self;
             }
             std::u32string out = text;
             const std::size_t insert_at = !text.empty() && (text[0] == '+' || text[0] == '-') ? 1 : 0;
             out.insert(insert_at, std::u32string(static_cast<std::size_t>(width - length), U'0'));
             return Value::Str(EncodeUtf8(out));
         }},
        {"partition", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("partition", args, 1, 1);
             const auto& sep = RequireStr(args.positional[0], "must be str");
             if (sep.empty()) {
                 ThrowError("ValueError", "empty separator");
             }
             const auto& text = self.AsStr();
             const auto found = text.find(sep);
             if (found == std::string::npos) {
                 return Value::Tuple({self, Value::Str(""), Value::Str("")});
             }
             return Value::Tuple({Value::Str(text.substr(0, found)), Value::Str(sep),
                                  Value::Str(text.substr(found + sep.size()))});
         }},
        {"rpartition", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("rpartition", args, 1, 1);
             const auto& sep = RequireStr(args.positional[0], "must be str");
             if (sep.empty()) {
                 ThrowError("ValueError", "empty separator");
             }
             const auto& text = self.AsStr();
             const auto found = text.rfind(sep);
             if (found == std::string::npos) {
                 return Value::Tuple({Value::Str(""), Value::Str(""), self});
             }
             return Value::Tuple({Value::Str(text.substr(0, found)), Value::Str(sep),
                                  Value::Str(text.substr(found + sep.size()))});
         }},
        {"removeprefix", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("removeprefix", args, 1, 1);
             const auto& prefix = RequireStr(args.positional[0], "removeprefix() argument must be str");
             const auto& text = self.AsStr();
             if (text.compare(0, prefix.size(), prefix) == 0) {
                 return Value::Str(text.substr(prefix.size()));
             }
             return self;
         }},
        {"removesuffix", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("removesuffix", args, 1, 1);
             const auto& suffix = RequireStr(args.positional[0], "removesuffix() argument must be str");
             const auto& text = self.AsStr();
             if (!suffix.empty() && text.size() >= suffix.size() &&
                 text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0) {
                 return Value::Str(text.substr(0, text.size() - suffix.size()));
             }
             return self;
         }},
        {"format", [](Interpreter&, const Value& self, CallArguments& args) {
             return Value::Str(StrFormat(self.AsStr(), args));
         }},
    };
    return kMethods;
}

const std::vector<Value>& TupleOrListItems(const Value& self) {
    return self.kind() == ValueKind::kList ? self.AsList()->items : self.AsTuple()->items;
}

Value SequenceIndex(const Value& self, CallArguments& args) {
    CheckArity("index", args, 1, 3);
    const auto& items = TupleOrListItems(self);
    std::int64_t start = 0;
    std::int64_t end = 0;
    ResolveRange(args, 1, static_cast<std::int64_t>(items.size()), start, end);
    for (auto i = start; i < end; ++i) {
        if (Equals(items[static_cast<std::size_t>(i)], args.positional[0])) {
            return Value::Int(i);
        }
    }
    if (self.kind() == ValueKind::kTuple) {
        ThrowError("ValueError", "tuple.index(x): x not in tuple");
    }
    ThrowError("ValueError", Repr(args.positional[0]) + " is not in list");
}

Value SequenceCount(const Value& self, CallArguments& args) {
    CheckArity("count", args, 1, 1);
    const auto& items = TupleOrListItems(self);
    std::int64_t count = 0;
    for (const auto& item : items) {
        if (Equals(item, args.positional[0])) {
            ++count;
        }
    }
    return Value::Int(count);
}

const MethodTable& ListMethods() {
    static const MethodTable kMethods = {
        {"append", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckArity("append", args, 1, 1);
             auto& items = self.AsList()->items;
             items.push_back(args.positional[0]);
             interpreter.CheckContainerSize(items.size());
             return Value::None();
         }},
        {"extend", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckArity("extend", args, 1, 1);
             auto extra = interpreter.Materialize(args.positional[0]);
             auto& items = self.AsList()->items;
             interpreter.CheckContainerSize(items.size() + extra.size());
             items.insert(items.end(), std::make_move_iterator(extra.begin()), std::make_move_iterator(extra.end()));
             return Value::None();
         }},
        {"insert", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckArity("insert", args, 2, 2);
             auto& items = self.AsList()->items;
             const auto position = ClampIndex(RequireInt(args.positional[0]), static_cast<std::int64_t>(items.size()));
             items.insert(items.begin() + position, args.positional[1]);
             interpreter.CheckContainerSize(items.size());
             return Value::None();
         }},
        {"pop", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("pop", args, 0, 1);
             auto& items = self.AsList()->items;
             if (items.empty()) {
                 ThrowError("IndexError", "pop from empty list");
             }
             std::int64_t position = args.positional.empty() ? -1 : RequireInt(args.positional[0]);
             const auto length = static_cast<std::int64_t>(items.size());
             if (position < 0) {
                 position += length;
             }
             if (position < 0 || position >= length) {
                 ThrowError("IndexError", "pop index out of range");
             }
             Value result = items[static_cast<std::size_t>(position)];
             items.erase(items.begin() + position);
             return result;
         }},
        {"remove", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("remove", args, 1, 1);
             auto& items = self.AsList()->items;
             for (auto it = items.begin(); it != items.end(); ++it) {
                 if (Equals(*it, args.positional[0])) {
                     items.erase(it);
                     return Value::None();
                 }
             }
             ThrowError("ValueError", "list.remove(x): x not in list");
         }},
        {"index", [](Interpreter&, const Value& self, CallArguments& args) { return SequenceIndex(self, args); }},
        {"count", [](Interpreter&, const Value& self, CallArguments& args) { return SequenceCount(self, args); }},
        {"sort", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckKeywords("sort", args, {"key", "reverse"});
             if (!args.positional.empty()) {
                 ThrowError("TypeError", "sort() takes no positional arguments");
             }
             const Value* key = args.Keyword("key");
             const Value* reverse = args.Keyword("reverse");
             auto items = self.AsList()->items;
             SortValues(interpreter, items, key, reverse != nullptr && Truthy(*reverse));
             self.AsList()->items = std::move(items);
             return Value::None();
         }},
        {"reverse", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("reverse", args, 0, 0);
             auto& items = self.AsList()->items;
             std::reverse(items.begin(), items.end());
             return Value::None();
         }},
        {"copy", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("copy", args, 0, 0);
             return Value::List(self.AsList()->items);
         }},
        {"clear", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("clear", args, 0, 0);
             self.AsList()->items.clear();
             return Value::None();
         }},
    };
    return kMethods;
}

const MethodTable& TupleMethods() {
    static const MethodTable kMethods = {
        {"index", [](Interpreter&, const Value& self, CallArguments& args) { return SequenceIndex(self, args); }},
        {"count", [](Interpreter&, const Value& self, CallArguments& args) { return SequenceCount(self, args); }},
    };
    return kMethods;
}

void UpdateDict(Interpreter& interpreter, DictObject& dict, const Value& source) {
    if (source.kind() == ValueKind::kDict) {
        for (const auto& entry : source.AsDict()->entries) {
            dict.Set(entry.first, entry.second);
        }
    } else {
        std::size_t position = 0;
        for (const auto& item : interpreter.Materialize(source)) {
            const auto pair = interpreter.Materialize(item);
            if (pair.size() != 2) {
                ThrowError("ValueError", "dictionary update sequence element #" + std::to_string(position) +
                                             " has length " + std::to_string(pair.size()) + "; 2 is required");
            }
            dict.Set(pair[0], pair[1]);
            ++position;
        }
    }
    interpreter.CheckContainerSize(dict.size());
}

// Class methods reached through the dict type itself, as in dict.fromkeys(keys).
const MethodTable& DictTypeMethods() {
    static const MethodTable kMethods = {
        {"fromkeys", [](Interpreter& interpreter, const Value&, CallArguments& args) {
             CheckArity("fromkeys", args, 1, 2);
             const Value fill = args.positional.size() > 1 ? args.positional[1] : Value::None();
             auto result = Value::Dict();
             auto dict = result.AsDict();
             auto next = interpreter.MakeIterator(args.positional[0]);
             while (auto key = next()) {
                 interpreter.Tick();
                 dict->Set(*key, fill);
                 interpreter.CheckContainerSize(dict->size());
             }
             return result;
         }},
    };
    return kMethods;
}

const MethodTable& DictMethods() {
    static const MethodTable kMethods = {
        {"get", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("get", args, 1, 2);
             const auto* found = self.AsDict()->Find(args.positional[0]);
             if (found != nullptr) {
                 return *found;
             }
             return args.positional.size() > 1 ? args.positional[1] : Value::None();
         }},
        {"keys", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("keys", args, 0, 0);
             std::vector<Value> keys;
             for (const auto& entry : self.AsDict()->entries) {
                 keys.push_back(entry.first);
             }
             return MakeView("dict_keys", std::move(keys));
         }},
        {"values", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("values", args, 0, 0);
             std::vector<Value> values;
             for (const auto& entry : self.AsDict()->entries) {
                 values.push_back(entry.second);
             }
             return MakeView("dict_values", std::move(values));
         }},
        {"items", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("items", args, 0, 0);
             std::vector<Value> items;
             for (const auto& entry : self.AsDict()->entries) {
                 items.push_back(Value::Tuple({entry.first, entry.second}));
             }
             return MakeView("dict_items", std::move(items));
         }},
        {"pop", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("pop", args, 1, 2);
             auto dict = self.AsDict();
             const auto* found = dict->Find(args.positional[0]);
             if (found == nullptr) {
                 if (args.positional.size() > 1) {
                     return args.positional[1];
                 }
                 ThrowKeyError(args.positional[0]);
             }
             Value result = *found;
             dict->Erase(args.positional[0]);
             return result;
         }},
        {"popitem", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("popitem", args, 0, 0);
             auto dict = self.AsDict();
             if (dict->size() == 0) {
                 ThrowError("KeyError", "popitem(): dictionary is empty");
             }
             const auto entry = dict->entries.back();
             dict->Erase(entry.first);
             return Value::Tuple({entry.first, entry.second});
         }},
        {"setdefault", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckArity("setdefault", args, 1, 2);
             auto dict = self.AsDict();
             const auto* found = dict->Find(args.positional[0]);
             if (found != nullptr) {
                 return *found;
             }
             Value fallback = args.positional.size() > 1 ? args.positional[1] : Value::None();
             dict->Set(args.positional[0], fallback);
             interpreter.CheckContainerSize(dict->size());
             return fallback;
         }},
        {"update", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             if (args.positional.size() > 1) {
                 ThrowError("TypeError", "update expected at most 1 argument, got " +
                                             std::to_string(args.positional.size()));
             }
             auto dict = self.AsDict();
             if (!args.positional.empty()) {
                 UpdateDict(interpreter, *dict, args.positional[0]);
             }
             for (const auto& keyword : args.keywords) {
                 dict->Set(Value::Str(keyword.first), keyword.second);
             }
             return Value::None();
         }},
        {"copy", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("copy", args, 0, 0);
             auto copy = Value::Dict();
             for (const auto& entry : self.AsDict()->entries) {
                 copy.AsDict()->Set(entry.first, entry.second);
             }
             return copy;
         }},
        {"clear", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("clear", args, 0, 0);
             self.AsDict()->Clear();
             return Value::None();
         }},
    };
    return kMethods;
}

Value SetFrom(Interpreter& interpreter, const Value& iterable) {
    auto result = Value::Set();
    for (const auto& item : interpreter.Materialize(iterable)) {
        result.AsSet()->Add(item);
    }
    return result;
}

Value CopySet(const SetObject& source) {
    auto copy = Value::Set();
    for (const auto& item : source.items) {
        copy.AsSet()->Add(item);
    }
    return copy;
}

// Folds every argument into self with a set operator, returning a new set.
Value FoldSets(Interpreter& interpreter, const Value& self, CallArguments& args, BinaryOperator op,
               const std::string& name) {
    CheckKeywords(name, args, {});
    Value result = CopySet(*self.AsSet());
    for (const auto& other : args.positional) {
        result = BinaryOperation(interpreter, op, result, SetFrom(interpreter, other));
    }
    return result;
}

void ReplaceSet(Interpreter& interpreter, const Value& self, const Value& replacement) {
    auto set = self.AsSet();
    set->Clear();
    for (const auto& item : replacement.AsSet()->items) {
        set->Add(item);
    }
    interpreter.CheckContainerSize(set->size());
}

const MethodTable& SetMethods() {
    static const MethodTable kMethods = {
        {"add", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckArity("add", args, 1, 1);
             self.AsSet()->Add(args.positional[0]);
             interpreter.CheckContainerSize(self.AsSet()->size());
             return Value::None();
         }},
        {"remove", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("remove", args, 1, 1);
             if (!self.AsSet()->Erase(args.positional[0])) {
                 ThrowKeyError(args.positional[0]);
             }
             return Value::None();
         }},
        {"discard", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("discard", args, 1, 1);
             self.AsSet()->Erase(args.positional[0]);
             return Value::None();
         }},
        {"pop", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("pop", args, 0, 0);
             auto set = self.AsSet();
             if (set->size() == 0) {
                 ThrowError("KeyError", "pop from an empty set");
             }
             Value item = set->items.front();
             set->Erase(item);
             return item;
         }},
        {"clear", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("clear", args, 0, 0);
             self.AsSet()->Clear();
             return Value::None();
         }},
        {"copy", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("copy", args, 0, 0);
             return CopySet(*self.AsSet());
         }},
        {"union", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             return FoldSets(interpreter, self, args, BinaryOperator::kBitOr, "union");
         }},
        {"intersection", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             return FoldSets(interpreter, self, args, BinaryOperator::kBitAnd, "intersection");
         }},
        {"difference", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             return FoldSets(interpreter, self, args, BinaryOperator::kSub, "difference");
         }},
        {"symmetric_difference", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckArity("symmetric_difference", args, 1, 1);
             return FoldSets(interpreter, self, args, BinaryOperator::kBitXor, "symmetric_difference");
         }},
        {"update", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             ReplaceSet(interpreter, self, FoldSets(interpreter, self, args, BinaryOperator::kBitOr, "update"));
             return Value::None();
         }},
        {"intersection_update", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             ReplaceSet(interpreter, self,
                        FoldSets(interpreter, self, args, BinaryOperator::kBitAnd, "intersection_update"));
             return Value::None();
         }},
        {"difference_update", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             ReplaceSet(interpreter, self, FoldSets(interpreter, self, args, BinaryOperator::kSub, "difference_update"));
             return Value::None();
         }},
        {"symmetric_difference_update", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckArity("symmetric_difference_update", args, 1, 1);
             ReplaceSet(interpreter, self,
                        FoldSets(interpreter, self, args, BinaryOperator::kBitXor, "symmetric_difference_update"));
             return Value::None();
         }},
        {"issubset", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckArity("issubset", args, 1, 1);
             const auto other = SetFrom(interpreter, args.positional[0]);
             const auto& items = self.AsSet()->items;
             return Value::Bool(std::all_of(items.begin(), items.end(),
                                            [&](const Value& item) { return other.AsSet()->Contains(item); }));
         }},
        {"issuperset", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckArity("issuperset", args, 1, 1);
             const auto other = SetFrom(interpreter, args.positional[0]);
             const auto& items = other.AsSet()->items;
             return Value::Bool(std::all_of(items.begin(), items.end(),
                                            [&](const Value& item) { return self.AsSet()->Contains(item); }));
         }},
        {"isdisjoint", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckArity("isdisjoint", args, 1, 1);
             const auto other = SetFrom(interpreter, args.positional[0]);
             const auto& items = other.AsSet()->items;
             return Value::Bool(std::none_of(items.begin(), items.end(),
                                             [&](const Value& item) { return self.AsSet()->Contains(item); }));
         }},
    };
    return kMethods;
}

Value Frozen(const Value& set) {
    auto frozen = Value::FrozenSet();
    for (const auto& item : set.AsSet()->items) {
        frozen.AsSet()->Add(item);
    }
    return frozen;
}

// frozenset shares the non-mutating set methods; derived sets stay frozen.
const MethodTable& FrozenSetMethods() {
    static const MethodTable kMethods = {
        {"union", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             return Frozen(FoldSets(interpreter, self, args, BinaryOperator::kBitOr, "union"));
         }},
        {"intersection", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             return Frozen(FoldSets(interpreter, self, args, BinaryOperator::kBitAnd, "intersection"));
         }},
        {"difference", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             return Frozen(FoldSets(interpreter, self, args, BinaryOperator::kSub, "difference"));
         }},
        {"symmetric_difference", [](Interpreter& interpreter, const Value& self, CallArguments& args) {
             CheckArity("symmetric_difference", args, 1, 1);
             return Frozen(FoldSets(interpreter, self, args, BinaryOperator::kBitXor, "symmetric_difference"));
         }},
        {"issubset", SetMethods().at("issubset")},
        {"issuperset", SetMethods().at("issuperset")},
        {"isdisjoint", SetMethods().at("isdisjoint")},
        {"copy", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("copy", args, 0, 0);
             return self;
         }},
    };
    return kMethods;
}

const MethodTable& IntMethods() {
    static const MethodTable kMethods = {
        {"bit_length", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("bit_length", args, 0, 0);
             auto value = self.AsInt();
             std::uint64_t magnitude = value < 0 ? 0 - static_cast<std::uint64_t>(value) : static_cast<std::uint64_t>(value);
             std::int64_t bits = 0;
             while (magnitude != 0) {
                 ++bits;
                 magnitude >>= 1;
             }
             return Value::Int(bits);
         }},
    };
    return kMethods;
}

const MethodTable& FloatMethods() {
    static const MethodTable kMethods = {
        {"is_integer", [](Interpreter&, const Value& self, CallArguments& args) {
             CheckArity("is_integer", args, 0, 0);
             const double value = self.AsDouble();
             return Value::Bool(std::isfinite(value) && std::trunc(value) == value);
         }},
    };
    return kMethods;
}

const MethodTable* TableFor(const Value& self) {
    switch (self.kind()) {
        case ValueKind::kStr: return &StrMethods();
        case ValueKind::kList: return &ListMethods();
        case ValueKind::kTuple: return &TupleMethods();
        case ValueKind::kDict: return &DictMethods();
        case ValueKind::kSet: return &SetMethods();
        case ValueKind::kFrozenSet: return &FrozenSetMethods();
        case ValueKind::kInt:
        case ValueKind::kBool: return &IntMethods();
        case ValueKind::kFloat: return &FloatMethods();
        case ValueKind::kBuiltin:
            return self.AsBuiltin()->constructs == "dict" ? &DictTypeMethods() : nullptr;
        default: return nullptr;
    }
}

// ---------------------------------------------------------------------------
// Formatting

struct FormatSpec {
    char fill = ' ';
    char align = 0;
    char sign = '-';
    bool alternate = false;
    std::int64_t width = 0;
    char grouping = 0;
    int precision = -1;
    char type = 0;
};

FormatSpec ParseSpec(const std::string& spec) {
    FormatSpec parsed;
    std::size_t i = 0;
    auto is_align = [](char ch) { return ch == '<' || ch == '>' || ch == '=' || ch == '^'; };
    if (spec.size() >= 2 && is_align(spec[1])) {
        parsed.fill = spec[0];
        parsed.align = spec[1];
        i = 2;
    } else if (!spec.empty() && is_align(spec[0])) {
        parsed.align = spec[0];
        i = 1;
    }
    if (i < spec.size() && (spec[i] == '+' || spec[i] == '-' || spec[i] == ' ')) {
        parsed.sign = spec[i++];
    }
    if (i < spec.size() && spec[i] == '#') {
        parsed.alternate = true;
        ++i;
    }
    if (i < spec.size() && spec[i] == '0') {
        if (parsed.align == 0) {
            parsed.fill = '0';
            parsed.align = '=';
        }
        ++i;
    }
    while (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
        parsed.width = parsed.width * 10 + (spec[i++] - '0');
        if (parsed.width > 100000) {
            ThrowError("ValueError", "Too many decimal digits in format string");
        }
    }
    if (i < spec.size() && (spec[i] == ',' || spec[i] == '_')) {
        parsed.grouping = spec[i++];
    }
    if (i < spec.size() && spec[i] == '.') {
        ++i;
        if (i >= spec.size() || !std::isdigit(static_cast<unsigned char>(spec[i]))) {
            ThrowError("ValueError", "Format specifier missing precision");
        }
        parsed.precision = 0;
        while (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
            parsed.precision = parsed.precision * 10 + (spec[i++] - '0');
            if (parsed.precision > 1000) {
                ThrowError("ValueError", "Too many decimal digits in format string");
            }
        }
    }
    if (i < spec.size()) {
        parsed.type = spec[i++];
    }
    if (i != spec.size()) {
        ThrowError("ValueError", "Invalid format specifier");
    }
    return parsed;
}

std::string Group(const std::string& digits, char separator) {
    if (separator == 0) {
        return digits;
    }
    std::string out;
    const std::size_t head = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i - head) % 3 == 0 && i >= head) {
            out.push_back(separator);
        }
        out.push_back(digits[i]);
    }
    return out;
}

std::string Pad(const std::string& sign, const std::string& body, const FormatSpec& spec, char default_align) {
    const char align = spec.align == 0 ? default_align : spec.align;
    const auto length = static_cast<std::int64_t>(CodePointLength(sign) + CodePointLength(body));
    if (spec.width <= length) {
        return sign + body;
    }
    const auto padding = static_cast<std::size_t>(spec.width - length);
    const std::string fill_char(1, spec.fill);
    auto fill = [&](std::size_t count) {
        std::string out;
        for (std::size_t i = 0; i < count; ++i) {
            out += fill_char;
        }
        return out;
    };
    switch (align) {
        case '<': return sign + body + fill(padding);
        case '^': return fill(padding / 2) + sign + body + fill(padding - padding / 2);
        case '=': return sign + fill(padding) + body;
        default: return fill(padding) + sign + body;
    }
}

std::string SignFor(bool negative, char sign) {
    if (negative) {
        return "-";
    }
    if (sign == '+') {
        return "+";
    }
    if (sign == ' ') {
        return " ";
    }
    return "";
}

std::string CFormat(char type, int precision, double value) {
    const char format[] = {'%', '.', '*', type, '\0'};
    const int size = std::snprintf(nullptr, 0, format, precision, value);
    std::string out(static_cast<std::size_t>(size) + 1, '\0');
    std::snprintf(&out[0], out.size(), format, precision, value);
    out.resize(static_cast<std::size_t>(size));
    return out;
}

std::string FormatFloatBody(double magnitude, const FormatSpec& spec) {
    const bool upper = spec.type == 'E' || spec.type == 'F' || spec.type == 'G';
    if (std::isinf(magnitude)) {
        return upper ? "INF" : "inf";
    }
    if (std::isnan(magnitude)) {
        return upper ? "NAN" : "nan";
    }
    std::string body;
    switch (spec.type) {
        case 'e':
        case 'E':
            body = CFormat(spec.type, spec.precision < 0 ? 6 : spec.precision, magnitude);
            break;
        case 'f':
        case 'F':
            body = CFormat('f', spec.precision < 0 ? 6 : spec.precision, magnitude);
            break;
        case '%':
            body = CFormat('f', spec.precision < 0 ? 6 : spec.precision, magnitude * 100.0) + "%";
            break;
        case 'g':
        case 'G':
            body = CFormat(spec.type, spec.precision < 0 ? 6 : spec.precision, magnitude);
            break;
        default:
            if (spec.precision < 0) {
                body = FormatFloat(magnitude);
            } else {
                body = CFormat('g', spec.precision == 0 ? 1 : spec.precision, magnitude);
                if (body.find_first_of(".e") == std::string::npos) {
                    body += ".0";
                }
            }
    }
    if (spec.grouping != 0) {
        const auto end = body.find_first_of(".e%");
        const auto integral = body.substr(0, end);
        body = Group(integral, spec.grouping) + (end == std::string::npos ? "" : body.substr(end));
    }
    return body;
}

std::string FormatInteger(std::int64_t value, const FormatSpec& spec) {
    const bool negative = value < 0;
    std::uint64_t magnitude = negative ? 0 - static_cast<std::uint64_t>(value) : static_cast<std::uint64_t>(value);
    std::string digits;
    std::string prefix;
    int base = 10;
    switch (spec.type) {
        case 'b': base = 2; prefix = "0b"; break;
        case 'o': base = 8; prefix = "0o"; break;
        case 'x': base = 16; prefix = "0x"; break;
        case 'X': base = 16; prefix = "0X"; break;
        default: break;
    }
    const char* alphabet = spec.type == 'X' ? "0123456789ABCDEF" : "0123456789abcdef";
    do {
        digits.push_back(alphabet[magnitude % static_cast<std::uint64_t>(base)]);
        magnitude /= static_cast<std::uint64_t>(base);
    } while (magnitude != 0);
    std::reverse(digits.begin(), digits.end());
    if (base == 10) {
        digits = Group(digits, spec.grouping);
    }
    return Pad(SignFor(negative, spec.sign) + (spec.alternate ? prefix : ""), digits, spec, '>');
}

}  // namespace

void CheckArity(const std::string& name, const CallArguments& args, std::size_t min, std::size_t max) {
    if (!args.keywords.empty()) {
        ThrowError("TypeError", name + "() takes no keyword arguments");
    }
    const auto count = args.positional.size();
    if (count >= min && count <= max) {
        return;
    }
    const auto given = std::to_string(count);
    if (min == max) {
        if (min == 0) {
            ThrowError("TypeError", name + "() takes no arguments (" + given + " given)");
        }
        if (min == 1) {
            ThrowError("TypeError", name + "() takes exactly one argument (" + given + " given)");
        }
        ThrowError("TypeError", name + "() takes exactly " + std::to_string(min) + " arguments (" + given + " given)");
    }
    if (count < min) {
        ThrowError("TypeError", name + " expected at least " + std::to_string(min) + " argument" +
                                    (min == 1 ? "" : "s") + ", got " + given);
    }
    ThrowError("TypeError", name + " expected at most " + std::to_string(max) + " argument" + (max == 1 ? "" : "s") +
                                ", got " + given);
}

void CheckKeywords(const std::string& name, const CallArguments& args, const std::vector<std::string>& allowed) {
    for (const auto& keyword : args.keywords) {
        if (std::find(allowed.begin(), allowed.end(), keyword.first) == allowed.end()) {
            ThrowError("TypeError", "'" + keyword.first + "' is an invalid keyword argument for " + name + "()");
        }
    }
}

const Value* Argument(const CallArguments& args, std::size_t position, const std::string& keyword) {
    if (position < args.positional.size()) {
        return &args.positional[position];
    }
    return args.Keyword(keyword);
}

std::int64_t RequireInt(const Value& value) {
    if (!value.IsIntegral()) {
        ThrowError("TypeError", "'" + TypeName(value) + "' object cannot be interpreted as an integer");
    }
    return value.AsInt();
}

const std::string& RequireStr(const Value& value, const std::string& context) {
    if (!value.IsStr()) {
        ThrowError("TypeError", context + ", not " + TypeName(value));
    }
    return value.AsStr();
}

bool HasMethod(const Value& self, const std::string& name) {
    const auto* table = TableFor(self);
    return table != nullptr && table->count(name) > 0;
}

Value CallMethod(Interpreter& interpreter, const Value& self, const std::string& name, CallArguments& args) {
    const auto* table = TableFor(self);
    if (table == nullptr) {
        ThrowError("AttributeError", "'" + TypeName(self) + "' object has no attribute '" + name + "'");
    }
    const auto it = table->find(name);
    if (it == table->end()) {
        ThrowError("AttributeError", "'" + TypeName(self) + "' object has no attribute '" + name + "'");
    }
    return it->second(interpreter, self, args);
}

std::string FormatValue(const Value& value, const std::string& spec_text) {
    if (spec_text.empty()) {
        return Str(value);
    }
    const auto spec = ParseSpec(spec_text);
    if (value.IsStr()) {
        if (spec.type != 0 && spec.type != 's') {
            ThrowError("ValueError", std::string("Unknown format code '") + spec.type + "' for object of type 'str'");
        }
        if (spec.sign != '-') {
            ThrowError("ValueError", "Sign not allowed in string format specifier");
        }
        if (spec.align == '=') {
            ThrowError("ValueError", "'=' alignment not allowed in string format specifier");
        }
        std::string text = value.AsStr();
        if (spec.precision >= 0) {
            const auto chars = DecodeUtf8(text);
            if (chars.size() > static_cast<std::size_t>(spec.precision)) {
                text = EncodeUtf8(chars.substr(0, static_cast<std::size_t>(spec.precision)));
            }
        }
        return Pad("", text, spec, '<');
    }
    if (value.IsIntegral()) {
        switch (spec.type) {
            case 0:
            case 'd':
            case 'n':
            case 'b':
            case 'o':
            case 'x':
            case 'X':
                if (spec.precision >= 0) {
                    ThrowError("ValueError", "Precision not allowed in integer format specifier");
                }
                return FormatInteger(value.AsInt(), spec);
            case 'c': {
                const auto code = value.AsInt();
                if (code < 0 || code > 0x10FFFF) {
                    ThrowError("OverflowError", "%c arg not in range(0x110000)");
                }
                return Pad("", EncodeUtf8(static_cast<char32_t>(code)), spec, '<');
            }
            case 'e':
            case 'E':
            case 'f':
            case 'F':
            case 'g':
            case 'G':
            case '%':
                break;
            default:
                ThrowError("ValueError", std::string("Unknown format code '") + spec.type + "' for object of type '" +
                                             TypeName(value) + "'");
        }
    }
    if (value.IsNumber()) {
        switch (spec.type) {
            case 0:
            case 'e':
            case 'E':
            case 'f':
            case 'F':
            case 'g':
            case 'G':
            case '%':
                break;
            default:
                ThrowError("ValueError", std::string("Unknown format code '") + spec.type +
                                             "' for object of type 'float'");
        }
        const double number = value.AsDouble();
        const bool negative = std::signbit(number) && !std::isnan(number);
        return Pad(SignFor(negative, spec.sign), FormatFloatBody(std::fabs(number), spec), spec, '>');
    }
    ThrowError("TypeError", "unsupported format string passed to " + TypeName(value) + ".__format__");
}

std::string PercentFormat(const std::string& format, const Value& args) {
    std::vector<Value> items;
    std::shared_ptr<DictObject> mapping;
    if (args.kind() == ValueKind::kTuple) {
        items = args.AsTuple()->items;
    } else {
        if (args.kind() == ValueKind::kDict) {
            mapping = args.AsDict();
        }
        items.push_back(args);
    }
    std::size_t next = 0;
    auto take = [&]() -> Value {
        if (next >= items.size()) {
            ThrowError("TypeError", "not enough arguments for format string");
        }
        return items[next++];
    };

    std::string out;
    std::size_t i = 0;
    while (i < format.size()) {
        const char ch = format[i];
        if (ch != '%') {
            out.push_back(ch);
            ++i;
            continue;
        }
        ++i;
        if (i >= format.size()) {
            ThrowError("ValueError", "incomplete format");
        }
        if (format[i] == '%') {
            out.push_back('%');
            ++i;
            continue;
        }
        Value argument;
        bool have_argument = false;
        if (format[i] == '(') {
            if (!mapping) {
                ThrowError("TypeError", "format requires a mapping");
            }
            const auto close = format.find(')', i);
            if (close == std::string::npos) {
                ThrowError("ValueError", "incomplete format key");
            }
            const auto key = Value::Str(format.substr(i + 1, close - i - 1));
            const auto* found = mapping->Find(key);
            if (found == nullptr) {
                ThrowKeyError(key);
            }
            argument = *found;
            have_argument = true;
            i = close + 1;
        }
        bool left = false;
        bool zero = false;
        char sign = 0;
        bool alternate = false;
        while (i < format.size() && std::string("-+ 0#").find(format[i]) != std::string::npos) {
            switch (format[i]) {
                case '-': left = true; break;
                case '0': zero = true; break;
                case '#': alternate = true; break;
                default: sign = sign == '+' ? '+' : format[i];
            }
            ++i;
        }
        std::string width;
        if (i < format.size() && format[i] == '*') {
            width = std::to_string(RequireInt(take()));
            if (!width.empty() && width[0] == '-') {
                left = true;
                width.erase(0, 1);
            }
            ++i;
        }
        while (i < format.size() && std::isdigit(static_cast<unsigned char>(format[i]))) {
            width.push_back(format[i++]);
        }
        std::string precision;
        if (i < format.size() && format[i] == '.') {
            ++i;
            precision = "0";
            std::string digits;
            while (i < format.size() && std::isdigit(static_cast<unsigned char>(format[i]))) {
                digits.push_back(format[i++]);
            }
            if (!digits.empty()) {
                precision = digits;
            }
        }
        while (i < format.size() && (format[i] == 'h' || format[i] == 'l' || format[i] == 'L')) {
            ++i;
        }
        if (i >= format.size()) {
            ThrowError("ValueError", "incomplete format");
        }
        char conversion = format[i++];
        if (!have_argument) {
            argument = take();
        }

        std::string spec;
        spec += left ? "<" : (zero && conversion != 's' && conversion != 'r' && conversion != 'a' ? "" : ">");
        if (sign != 0) {
            spec.push_back(sign);
        }
        if (alternate) {
            spec.push_back('#');
        }
        if (zero && !left && conversion != 's' && conversion != 'r' && conversion != 'a') {
            spec.push_back('0');
        }
        spec += width;
        switch (conversion) {
            case 's':
            case 'r':
            case 'a': {
                const std::string text = conversion == 's' ? Str(argument) : Repr(argument);
                if (!precision.empty()) {
                    spec += "." + precision;
                }
                out += FormatValue(Value::Str(text), spec + "s");
                break;
            }
            case 'd':
            case 'i':
            case 'u':
                if (!argument.IsNumber()) {
                    ThrowError("TypeError", std::string("%") + conversion + " format: a real number is required, not " +
                                                TypeName(argument));
                }
                if (argument.IsFloat()) {
                    argument = Value::Int(static_cast<std::int64_t>(std::trunc(argument.AsDouble())));
                }
                out += FormatValue(Value::Int(argument.AsInt()), spec + "d");
                break;
            case 'x':
            case 'X':
            case 'o':
                if (!argument.IsIntegral()) {
                    ThrowError("TypeError", std::string("%") + conversion + " format: an integer is required, not " +
                                                TypeName(argument));
                }
                out += FormatValue(Value::Int(argument.AsInt()), spec + conversion);
                break;
            case 'e':
            case 'E':
            case 'f':
            case 'F':
            case 'g':
            case 'G':
                if (!argument.IsNumber()) {
                    ThrowError("TypeError", "must be real number, not " + TypeName(argument));
                }
                if (!precision.empty()) {
                    spec += "." + precision;
                }
                out += FormatValue(Value::Float(argument.AsDouble()), spec + conversion);
                break;
            case 'c':
                if (argument.IsStr() && CodePointLength(argument.AsStr()) == 1) {
                    out += FormatValue(argument, spec + "s");
                } else if (argument.IsIntegral()) {
                    out += FormatValue(argument, spec + "c");
                } else {
                    ThrowError("TypeError", "%c requires int or char");
                }
                break;
            default: {
                char detail[64];
                std::snprintf(detail, sizeof(detail), "unsupported format character '%c' (0x%x) at index %zu",
                              conversion, static_cast<unsigned>(static_cast<unsigned char>(conversion)), i - 1);
                ThrowError("ValueError", detail);
            }
        }
    }
    if (!mapping && next < items.size()) {
        ThrowError("TypeError", "not all arguments converted during string formatting");
    }
    return out;
}

namespace {

// Auto-numbering state shared by a format string and the replacement fields
// nested in its format specs.
struct FieldNumbering {
    std::size_t next = 0;
    bool manual = false;
    bool automatic = false;
};

bool IsDecimal(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

std::int64_t ParseFieldNumber(const std::string& digits) {
    std::int64_t number = 0;
    const auto result = std::from_chars(digits.data(), digits.data() + digits.size(), number);
    if (result.ec != std::errc() || result.ptr != digits.data() + digits.size()) {
        ThrowError("ValueError", "Too many decimal digits in format string");
    }
    return number;
}

Value ResolveField(const std::string& field, const CallArguments& args, FieldNumbering& numbering) {
    std::size_t end = field.find_first_of(".[");
    const std::string head = field.substr(0, end);
    Value value;
    if (head.empty()) {
        if (numbering.manual) {
            ThrowError("ValueError", "cannot switch from manual field specification to automatic field numbering");
        }
        numbering.automatic = true;
        if (numbering.next >= args.positional.size()) {
            ThrowError("IndexError", "Replacement index " + std::to_string(numbering.next) +
                                         " out of range for positional args tuple");
        }
        value = args.positional[numbering.next++];
    } else if (IsDecimal(head)) {
        if (numbering.automatic) {
            ThrowError("ValueError", "cannot switch from automatic field numbering to manual field specification");
        }
        numbering.manual = true;
        const auto index = static_cast<std::size_t>(ParseFieldNumber(head));
        if (index >= args.positional.size()) {
            ThrowError("IndexError", "Replacement index " + head + " out of range for positional args tuple");
        }
        value = args.positional[index];
    } else {
        const auto* found = args.Keyword(head);
        if (found == nullptr) {
            ThrowKeyError(Value::Str(head));
        }
        value = *found;
    }
    while (end != std::string::npos) {
        if (field[end] == '.') {
            const auto next = field.find_first_of(".[", end + 1);
            const auto attribute = field.substr(end + 1, next == std::string::npos ? next : next - end - 1);
            ThrowError("AttributeError", "'" + TypeName(value) + "' object has no attribute '" + attribute + "'");
        }
        const auto close = field.find(']', end);
        if (close == std::string::npos) {
            ThrowError("ValueError", "Missing ']' in format string");
        }
        const auto key = field.substr(end + 1, close - end - 1);
        value = GetItem(value, IsDecimal(key) ? Value::Int(ParseFieldNumber(key)) : Value::Str(key));
        end = close + 1 < field.size() ? close + 1 : std::string::npos;
    }
    return value;
}

// recursion counts down from 2 so a spec may hold fields but those fields may
// not hold further fields.
std::string ExpandFormat(const std::string& format, const CallArguments& args, FieldNumbering& numbering,
                         int recursion) {
    if (recursion <= 0) {
        ThrowError("ValueError", "Max string recursion exceeded");
    }
    std::string out;
    std::size_t i = 0;
    while (i < format.size()) {
        const char ch = format[i];
        if (ch == '}') {
            if (i + 1 < format.size() && format[i + 1] == '}') {
                out.push_back('}');
                i += 2;
                continue;
            }
            ThrowError("ValueError", "Single '}' encountered in format string");
        }
        if (ch != '{') {
            out.push_back(ch);
            ++i;
            continue;
        }
        if (i + 1 < format.size() && format[i + 1] == '{') {
            out.push_back('{');
            i += 2;
            continue;
        }
        std::size_t j = i + 1;
        int depth = 1;
        while (j < format.size()) {
            if (format[j] == '{') {
                ++depth;
            } else if (format[j] == '}' && --depth == 0) {
                break;
            }
            ++j;
        }
        if (j >= format.size()) {
            ThrowError("ValueError", "expected '}' before end of string");
        }
        const std::string field = format.substr(i + 1, j - i - 1);
        i = j + 1;

        std::size_t name_end = field.find_first_of("!:");
        std::string name = field.substr(0, name_end);
        char conversion = 0;
        std::string spec;
        if (name_end != std::string::npos && field[name_end] == '!') {
            if (name_end + 1 >= field.size()) {
                ThrowError("ValueError", "end of string while looking for conversion specifier");
            }
            conversion = field[name_end + 1];
            if (conversion != 'r' && conversion != 's' && conversion != 'a') {
                ThrowError("ValueError", std::string("Unknown conversion specifier ") + conversion);
            }
            name_end += 2;
            if (name_end < field.size() && field[name_end] != ':') {
                ThrowError("ValueError", "expected ':' after conversion specifier");
            }
        }
        Value value = ResolveField(name, args, numbering);
        if (conversion == 's') {
            value = Value::Str(Str(value));
        } else if (conversion == 'r' || conversion == 'a') {
            value = Value::Str(Repr(value));
        }
        if (name_end != std::string::npos && name_end < field.size() && field[name_end] == ':') {
            spec = field.substr(name_end + 1);
            if (spec.find('{') != std::string::npos) {
                spec = ExpandFormat(spec, args, numbering, recursion - 1);
            }
        }
        out += FormatValue(value, spec);
    }
    return out;
}

}  // namespace

std::string StrFormat(const std::string& format, const CallArguments& args) {
    FieldNumbering numbering;
    return ExpandFormat(format, args, numbering, 2);
}

void SortValues(Interpreter& interpreter, std::vector<Value>& items, const Value* key, bool reverse) {
    std::vector<Value> keys;
    if (key != nullptr && !key->IsNone()) {
        keys.reserve(items.size());
        for (const auto& item : items) {
            keys.push_back(interpreter.Call(*key, std::vector<Value>{item}));
        }
    } else {
        keys = items;
    }
    std::vector<std::size_t> order(items.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) {
        return reverse ? LessThan(keys[rhs], keys[lhs]) : LessThan(keys[lhs], keys[rhs]);
    });
    std::vector<Value> sorted;
    sorted.reserve(items.size());
    for (const auto index : order) {
        sorted.push_back(std::move(items[index]));
    }
    items = std::move(sorted);
}

}  // namespace evalbox::lang
