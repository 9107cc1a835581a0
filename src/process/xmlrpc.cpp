#include "controlhub/process/xmlrpc.hpp"
#include "controlhub/utils/types.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace scoreboard::controlhub::xmlrpc {

using json = nlohmann::json;

namespace {

Error protocol_error(const std::string& message) {
    return MAKE_ERROR(PROTOCOL_ERROR, "XML-RPC: " + message);
}

void encode_value(std::ostringstream& out, const json& value) {
    out << "<value>";
    switch (value.type()) {
        case json::value_t::boolean:
            out << "<boolean>" << (value.get<bool>() ? 1 : 0) << "</boolean>";
            break;
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            out << "<int>" << value.dump() << "</int>";
            break;
        case json::value_t::number_float:
            out << "<double>" << value.dump() << "</double>";
            break;
        case json::value_t::string:
            out << "<string>" << escape(value.get<std::string>()) << "</string>";
            break;
        case json::value_t::array:
            out << "<array><data>";
            for (const auto& element : value) {
                encode_value(out, element);
            }
            out << "</data></array>";
            break;
        case json::value_t::object:
            out << "<struct>";
            for (const auto& item : value.items()) {
                out << "<member><name>" << escape(item.key()) << "</name>";
                encode_value(out, item.value());
                out << "</member>";
            }
            out << "</struct>";
            break;
        default:
            out << "<nil/>";
            break;
    }
    out << "</value>";
}

struct Tag {
    std::string name;
    bool closing = false;
    bool self_closing = false;
};

// Pull reader over the subset of XML that XML-RPC responses use.
class Reader {
public:
    explicit Reader(const std::string& text) : text_(text) {}

    void skip_space() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    Result<void> skip_prolog() {
        while (true) {
            skip_space();
            if (text_.compare(pos_, 2, "<?") == 0) {
                RETURN_IF_ERROR(skip_past("?>"));
            } else if (text_.compare(pos_, 4, "<!--") == 0) {
                RETURN_IF_ERROR(skip_past("-->"));
            } else {
                return {};
            }
        }
    }

    Result<Tag> read_tag() {
        RETURN_IF_ERROR(skip_prolog());
        if (pos_ >= text_.size() || text_[pos_] != '<') {
            return unexpected(protocol_error("expected a tag at offset " + std::to_string(pos_)));
        }
        ++pos_;

        Tag tag;
        if (pos_ < text_.size() && text_[pos_] == '/') {
            tag.closing = true;
            ++pos_;
        }
        while (pos_ < text_.size() && !std::isspace(static_cast<unsigned char>(text_[pos_])) &&
               text_[pos_] != '/' && text_[pos_] != '>') {
            tag.name.push_back(text_[pos_++]);
        }
        if (tag.name.empty()) {
            return unexpected(protocol_error("empty tag name"));
        }

        size_t end = text_.find('>', pos_);
        if (end == std::string::npos) {
            return unexpected(protocol_error("unterminated tag <" + tag.name + ">"));
        }
        tag.self_closing = end > pos_ && text_[end - 1] == '/';
        pos_ = end + 1;
        return tag;
    }

    Result<void> expect_open(const std::string& name) {
        Tag tag;
        ASSIGN_OR_RETURN(tag, read_tag());
        if (tag.closing || tag.self_closing || tag.name != name) {
            return unexpected(protocol_error("expected <" + name + ">, got <" + (tag.closing ? "/" : "") +
                                             tag.name + ">"));
        }
        return {};
    }

    Result<void> expect_close(const std::string& name) {
        Tag tag;
        ASSIGN_OR_RETURN(tag, read_tag());
        if (!tag.closing || tag.name != name) {
            return unexpected(protocol_error("expected </" + name + ">, got <" + (tag.closing ? "/" : "") +
                                             tag.name + ">"));
        }
        return {};
    }

    // Character data up to the next '<', entities decoded.
    Result<std::string> read_text() {
        size_t end = text_.find('<', pos_);
        if (end == std::string::npos) {
            return unexpected(protocol_error("unterminated character data"));
        }
        std::string raw = text_.substr(pos_, end - pos_);
        pos_ = end;
        return decode(raw);
    }

private:
    Result<void> skip_past(const char* terminator) {
        size_t end = text_.find(terminator, pos_);
        if (end == std::string::npos) {
            return unexpected(protocol_error(std::string("missing '") + terminator + "'"));
        }
        pos_ = end + std::char_traits<char>::length(terminator);
        return {};
    }

    static void append_utf8(std::string& out, unsigned long cp) {
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

    static Result<std::string> decode(const std::string& raw) {
        std::string out;
        out.reserve(raw.size());
        for (size_t i = 0; i < raw.size(); ++i) {
            if (raw[i] != '&') {
                out.push_back(raw[i]);
                continue;
            }
            size_t semi = raw.find(';', i);
            if (semi == std::string::npos) {
                return unexpected(protocol_error("unterminated entity"));
            }
            const std::string entity = raw.substr(i + 1, semi - i - 1);
            if (entity == "lt") out.push_back('<');
            else if (entity == "gt") out.push_back('>');
            else if (entity == "amp") out.push_back('&');
            else if (entity == "quot") out.push_back('"');
            else if (entity == "apos") out.push_back('\'');
            else if (entity.size() > 1 && entity[0] == '#') {
                const bool hex = entity[1] == 'x' || entity[1] == 'X';
                const std::string digits = entity.substr(hex ? 2 : 1);
                char* end = nullptr;
                unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
                if (digits.empty() || *end != '\0' || cp > 0x10FFFF) {
                    return unexpected(protocol_error("bad character reference &" + entity + ";"));
                }
                append_utf8(out, cp);
            } else {
                return unexpected(protocol_error("unknown entity &" + entity + ";"));
            }
            i = semi;
        }
        return out;
    }

    const std::string& text_;
    size_t pos_ = 0;
};

// Nesting limit for arrays and structs; supervisor replies are two levels deep.
constexpr int kMaxDepth = 32;

Result<json> parse_value(Reader& reader, int depth);

Result<json> parse_scalar(Reader& reader, const Tag& type) {
    std::string text;
    if (!type.self_closing) {
        ASSIGN_OR_RETURN(text, reader.read_text());
        RETURN_IF_ERROR(reader.expect_close(type.name));
    }

    if (type.name == "int" || type.name == "i4" || type.name == "i8") {
        char* end = nullptr;
        long long number = std::strtoll(text.c_str(), &end, 10);
        if (text.empty() || *end != '\0') {
            return unexpected(protocol_error("bad integer '" + text + "'"));
        }
        return json(static_cast<i64>(number));
    }
    if (type.name == "boolean") {
        if (text == "1") return json(true);
        if (text == "0") return json(false);
        return unexpected(protocol_error("bad boolean '" + text + "'"));
    }
    if (type.name == "double") {
        char* end = nullptr;
        double number = std::strtod(text.c_str(), &end);
        if (text.empty() || *end != '\0') {
            return unexpected(protocol_error("bad double '" + text + "'"));
        }
        return json(number);
    }
    if (type.name == "nil") {
        return json(nullptr);
    }
    if (type.name == "string" || type.name == "dateTime.iso8601" || type.name == "base64") {
        return json(text);
    }
    return unexpected(protocol_error("unsupported type <" + type.name + ">"));
}

Result<json> parse_array(Reader& reader, const Tag& type, int depth) {
    json array = json::array();
    if (type.self_closing) {
        return array;
    }

    Tag data;
    ASSIGN_OR_RETURN(data, reader.read_tag());
    if (data.name != "data" || data.closing) {
        return unexpected(protocol_error("expected <data> in <array>"));
    }
    if (!data.self_closing) {
        while (true) {
            Tag next;
            ASSIGN_OR_RETURN(next, reader.read_tag());
            if (next.closing && next.name == "data") {
                break;
            }
            if (next.name != "value" || next.closing) {
                return unexpected(protocol_error("expected <value> in <data>, got <" + next.name + ">"));
            }
            if (next.self_closing) {
                array.push_back(json(""));
                continue;
            }
            json element;
            ASSIGN_OR_RETURN(element, parse_value(reader, depth + 1));
            array.push_back(std::move(element));
        }
    }
    RETURN_IF_ERROR(reader.expect_close("array"));
    return array;
}

Result<json> parse_struct(Reader& reader, const Tag& type, int depth) {
    json object = json::object();
    if (type.self_closing) {
        return object;
    }

    while (true) {
        Tag next;
        ASSIGN_OR_RETURN(next, reader.read_tag());
        if (next.closing && next.name == "struct") {
            break;
        }
        if (next.name != "member" || next.closing || next.self_closing) {
            return unexpected(protocol_error("expected <member> in <struct>, got <" + next.name + ">"));
        }

        RETURN_IF_ERROR(reader.expect_open("name"));
        std::string name;
        ASSIGN_OR_RETURN(name, reader.read_text());
        RETURN_IF_ERROR(reader.expect_close("name"));

        Tag value_tag;
        ASSIGN_OR_RETURN(value_tag, reader.read_tag());
        if (value_tag.name != "value" || value_tag.closing) {
            return unexpected(protocol_error("expected <value> in <member> '" + name + "'"));
        }
        if (value_tag.self_closing) {
            object[name] = json("");
        } else {
            json member;
            ASSIGN_OR_RETURN(member, parse_value(reader, depth + 1));
            object[name] = std::move(member);
        }
        RETURN_IF_ERROR(reader.expect_close("member"));
    }
    return object;
}

// Called after <value> has been consumed; consumes through </value>.
Result<json> parse_value(Reader& reader, int depth) {
    if (depth > kMaxDepth) {
        return unexpected(protocol_error("values nested deeper than " + std::to_string(kMaxDepth) + " levels"));
    }
    std::string text;
    ASSIGN_OR_RETURN(text, reader.read_text());

    Tag tag;
    ASSIGN_OR_RETURN(tag, reader.read_tag());
    if (tag.closing) {
        if (tag.name != "value") {
            return unexpected(protocol_error("unexpected </" + tag.name + "> in <value>"));
        }
        // Untyped values are strings.
        return json(text);
    }

    json value;
    if (tag.name == "array") {
        ASSIGN_OR_RETURN(value, parse_array(reader, tag, depth));
    } else if (tag.name == "struct") {
        ASSIGN_OR_RETURN(value, parse_struct(reader, tag, depth));
    } else {
        ASSIGN_OR_RETURN(value, parse_scalar(reader, tag));
    }
    RETURN_IF_ERROR(reader.expect_close("value"));
    return value;
}

Result<json> parse_single_value(Reader& reader) {
    Tag tag;
    ASSIGN_OR_RETURN(tag, reader.read_tag());
    if (tag.name != "value" || tag.closing) {
        return unexpected(protocol_error("expected <value>, got <" + tag.name + ">"));
    }
    if (tag.self_closing) {
        return json("");
    }
    return parse_value(reader, 0);
}

}  // namespace

std::string escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '&': out += "&amp;"; break;
            case '"': out += "&quot;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string build_request(const std::string& method, const std::vector<json>& params) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\"?>\n<methodCall><methodName>" << escape(method) << "</methodName><params>";
    for (const auto& param : params) {
        out << "<param>";
        encode_value(out, param);
        out << "</param>";
    }
    out << "</params></methodCall>\n";
    return out.str();
}

Result<Response> parse_response(const std::string& body) {
    Reader reader(body);
    RETURN_IF_ERROR(reader.expect_open("methodResponse"));

    Tag tag;
    ASSIGN_OR_RETURN(tag, reader.read_tag());

    Response response;
    if (tag.name == "params" && !tag.closing && !tag.self_closing) {
        RETURN_IF_ERROR(reader.expect_open("param"));
        ASSIGN_OR_RETURN(response.value, parse_single_value(reader));
        RETURN_IF_ERROR(reader.expect_close("param"));
        RETURN_IF_ERROR(reader.expect_close("params"));
    } else if (tag.name == "fault" && !tag.closing && !tag.self_closing) {
        json fault;
        ASSIGN_OR_RETURN(fault, parse_single_value(reader));
        RETURN_IF_ERROR(reader.expect_close("fault"));

        if (!fault.is_object() || !fault.contains("faultCode") || !fault["faultCode"].is_number_integer()) {
            return unexpected(protocol_error("fault without integer faultCode"));
        }
        response.is_fault = true;
        response.fault_code = fault["faultCode"].get<int>();
        if (fault.contains("faultString") && fault["faultString"].is_string()) {
            response.fault_string = fault["faultString"].get<std::string>();
        }
    } else {
        return unexpected(protocol_error("expected <params> or <fault>, got <" + tag.name + ">"));
    }

    RETURN_IF_ERROR(reader.expect_close("methodResponse"));
    return response;
}

}  // namespace scoreboard::controlhub::xmlrpc
