#pragma once
#include "../dom/replay_log.hpp"
#include "../dom/structure/transition.hpp"
#include <chrono>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

namespace retrace::serialization {

    // Export-only JSON rendering of transition records. There is no reader.
    class TransitionSerializer {
      public:
        static std::string serialize(const dom::TransitionRecord &record) {
            std::stringstream ss;
            writeRecord(ss, record);
            return ss.str();
        }

        static std::string serialize(const dom::Transition &transition) { return serialize(transition.toStructured()); }

        static std::string serialize(const dom::ReplayLog &log) {
            std::stringstream ss;
            ss << "[";
            bool first = true;
            for (const auto &transition : log) {
                ss << (first ? "\n  " : ",\n  ");
                writeRecord(ss, transition.toStructured());
                first = false;
            }
            ss << (first ? "]" : "\n]") << "\n";
            return ss.str();
        }

        static bool saveToFile(const dom::ReplayLog &log, const std::string &filename) {
            std::ofstream file(filename);
            if (!file.is_open())
                return false;

            file << serialize(log);
            return static_cast<bool>(file);
        }

        static std::string escape(const std::string &value) {
            std::string out;
            out.reserve(value.size() + 2);
            for (char c : value) {
                switch (c) {
                case '"':
                    out += "\\\"";
                    break;
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                        out += buf;
                    } else {
                        out += c;
                    }
                }
            }
            return out;
        }

      private:
        static void writeRecord(std::ostream &os, const dom::TransitionRecord &record) {
            os << "{\"element\": \"" << escape(record.element) << "\", ";
            os << "\"event\": \"" << escape(record.event.name()) << "\", ";
            os << "\"options\": {";
            bool first = true;
            for (const auto &[key, value] : record.options) {
                if (!first)
                    os << ", ";
                os << "\"" << escape(key) << "\": ";
                writeValue(os, value);
                first = false;
            }
            os << "}, \"elapsed\": ";
            if (record.elapsed) {
                auto seconds = std::chrono::duration<double>(*record.elapsed).count();
                auto precision = os.precision();
                os << std::setprecision(std::numeric_limits<double>::max_digits10) << seconds;
                os.precision(precision);
            } else {
                os << "null";
            }
            os << "}";
        }

        static void writeValue(std::ostream &os, const dom::OptionValue &value) {
            std::visit(
                [&os](const auto &v) {
                    using V = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<V, std::monostate>) {
                        os << "null";
                    } else if constexpr (std::is_same_v<V, bool>) {
                        os << (v ? "true" : "false");
                    } else if constexpr (std::is_same_v<V, std::string>) {
                        os << "\"" << escape(v) << "\"";
                    } else if constexpr (std::is_same_v<V, double>) {
                        if (std::isfinite(v)) {
                            auto precision = os.precision();
                            os << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
                            os.precision(precision);
                        } else {
                            os << "null";
                        }
                    } else {
                        os << v;
                    }
                },
                value);
        }
    };

} // namespace retrace::serialization
