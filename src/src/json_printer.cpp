#include <jv/value.h>
#include <cstdio>
#include <functional>
#include <sstream>

namespace jv {

namespace {
    void write_string(std::ostream& out, const std::string& s) {
        out << '"';
        for (char c : s) {
            switch (c) {
                case '"': out << "\\\""; break;
                case '\\': out << "\\\\"; break;
                case '\b': out << "\\b"; break;
                case '\f': out << "\\f"; break;
                case '\n': out << "\\n"; break;
                case '\r': out << "\\r"; break;
                case '\t': out << "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                        out << buf;
                    } else {
                        out << c;
                    }
            }
        }
        out << '"';
    }

    void write_compact(std::ostream& out, const Value& val) {
        if (val.is_null()) { out << "null"; return; }
        if (val.is_bool()) { out << (val.as_bool() ? "true" : "false"); return; }
        if (val.is_number()) { out << val.as_number().literal; return; }
        if (val.is_string()) { write_string(out, val.as_string()); return; }
        if (val.is_list()) {
            const auto &L = val.as_list();
            out << '[';
            for (size_t i = 0; i < L.size(); ++i) {
                if (i) out << ',';
                write_compact(out, L[i]);
            }
            out << ']';
            return;
        }
        out << '{';
        bool first = true;
        for (auto const &p: val.as_dict().data) {
            if (!first) out << ',';
            first = false;
            write_string(out, p.first);
            out << ':';
            write_compact(out, p.second);
        }
        out << '}';
    }

    std::string pretty(const Value& root, int indent) {
        std::ostringstream out;
        std::function<void(const Value&, int)> printVal;

        printVal = [&](const Value &val, int level) {
            if (val.is_list()) {
                const auto &L = val.as_list();
                if (L.empty()) { out << "[]"; return; }
                out << "[\n";
                for (size_t i=0;i<L.size();++i) {
                    out << std::string(level+indent, ' ');
                    printVal(L[i], level+indent);
                    if (i+1 < L.size()) out << ",\n";
                    else out << "\n";
                }
                out << std::string(level, ' ') << "]";
                return;
            }
            if (val.is_dict()) {
                const auto &D = val.as_dict().data;
                if (D.empty()) { out << "{}"; return; }
                out << "{\n";
                size_t i = 0;
                for (auto const &p: D) {
                    out << std::string(level+indent, ' ');
                    write_string(out, p.first);
                    out << ": ";
                    printVal(p.second, level+indent);
                    if (++i < D.size()) out << ",\n"; else out << "\n";
                }
                out << std::string(level, ' ') << "}";
                return;
            }
            write_compact(out, val);
        };

        printVal(root, 0);
        return out.str();
    }
}

std::string Value::dump() const {
    std::ostringstream out;
    write_compact(out, *this);
    return out.str();
}

std::string Value::dump(int indent) const {
    if (indent <= 0) return dump();
    return pretty(*this, indent);
}

std::string Dictionary::dump() const { return Value(*this).dump(); }

std::string Dictionary::dump(int indent) const { return Value(*this).dump(indent); }

} // namespace jv
