#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "tslab/keys/index_key.hpp"
#include "tslab/slab/typed_slab.hpp"

namespace tslab_demo {

    struct entry_tag;
    using entry_key = tslab::keys::index_key<entry_tag>;

    inline std::vector<std::string> split_command(const std::string& line) {
        std::vector<std::string> args;
        std::string current;
        bool in_quotes = false;
        bool escaped = false;

        for (char ch : line) {
            if (escaped) {
                current += ch;
                escaped = false;
            }
            else if (ch == '\\') {
                escaped = true;
            }
            else if (ch == '"') {
                in_quotes = !in_quotes;
            }
            else if (std::isspace(static_cast<unsigned char>(ch)) && !in_quotes) {
                if (!current.empty()) {
                    args.push_back(current);
                    current.clear();
                }
            }
            else {
                current += ch;
            }
        }

        if (!current.empty()) {
            args.push_back(current);
        }

        return args;
    }

    inline std::optional<std::size_t> parse_count(std::string_view text) {
        if (text.empty()) {
            return std::nullopt;
        }
        std::size_t value = 0;
        const auto* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), last, value);
        if (ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        return value;
    }

    inline std::optional<entry_key> parse_key(std::string_view text) {
        if (text.empty()) {
            return std::nullopt;
        }
        std::uint32_t value = 0;
        const auto* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), last, value);
        if (ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        return entry_key{ value };
    }

    // Line oriented front end over a string slab. Output goes to `out`,
    // usage and lookup errors to `err`.
    class slab_shell {
    public:

        using store_type = tslab::slab::typed_slab<entry_key, std::string, tslab::slab::stats>;

        slab_shell(std::ostream& out, std::ostream& err, std::size_t capacity = 0)
            : out_(&out)
            , err_(&err)
            , store_(store_type::with_capacity(capacity))
        {}

        // false for unknown commands, bad usage and failed lookups
        bool execute(const std::vector<std::string>& args) {
            if (args.empty()) {
                return true;
            }
            const auto& cmd = args[0];
            try {
                if (cmd == "help") {
                    help();
                    return true;
                }
                else if (cmd == "insert") {
                    return cmd_insert(args);
                }
                else if (cmd == "get") {
                    return with_key(args, "get <key>", [this](entry_key k) { return cmd_get(k); });
                }
                else if (cmd == "set") {
                    if (args.size() < 3) {
                        return usage("set <key> <text>");
                    }
                    return with_key(args, "set <key> <text>", [this, &args](entry_key k) { return cmd_set(k, args[2]); });
                }
                else if (cmd == "remove") {
                    return with_key(args, "remove <key>", [this](entry_key k) { return cmd_remove(k); });
                }
                else if (cmd == "list") {
                    cmd_list(false);
                    return true;
                }
                else if (cmd == "rlist") {
                    cmd_list(true);
                    return true;
                }
                else if (cmd == "values") {
                    cmd_values();
                    return true;
                }
                else if (cmd == "drain") {
                    return cmd_drain(args, false);
                }
                else if (cmd == "drain-back") {
                    return cmd_drain(args, true);
                }
                else if (cmd == "len") {
                    *out_ << store_.len() << "\n";
                    return true;
                }
                else if (cmd == "capacity") {
                    *out_ << store_.capacity() << "\n";
                    return true;
                }
                else if (cmd == "reserve") {
                    if (args.size() < 2) {
                        return usage("reserve <count>");
                    }
                    auto count = parse_count(args[1]);
                    if (!count) {
                        return usage("reserve <count>");
                    }
                    store_.reserve(*count);
                    *out_ << "capacity " << store_.capacity() << "\n";
                    return true;
                }
                else if (cmd == "next") {
                    *out_ << "next key " << store_.vacant_key().get() << "\n";
                    return true;
                }
                else if (cmd == "clear") {
                    store_.clear();
                    *out_ << "cleared\n";
                    return true;
                }
                else if (cmd == "stats") {
                    cmd_stats();
                    return true;
                }
            }
            catch (const std::exception& e) {
                *err_ << "Error: " << e.what() << "\n";
                return false;
            }
            *err_ << "Unknown command: " << cmd << " (type 'help' for available commands)\n";
            return false;
        }

        bool execute(const std::string& line) {
            return execute(split_command(line));
        }

        const store_type& store() const noexcept {
            return store_;
        }

        void help() {
            *out_ << "\nSlab shell commands:\n";
            *out_ << "  insert <text>       - Store text, print its key\n";
            *out_ << "  get <key>           - Print the text stored under key\n";
            *out_ << "  set <key> <text>    - Replace the text stored under key\n";
            *out_ << "  remove <key>        - Remove key and print its text\n";
            *out_ << "  list / rlist        - Print key: text, ascending / descending\n";
            *out_ << "  values              - Print stored text only\n";
            *out_ << "  drain [n]           - Take out the first n values (default: all)\n";
            *out_ << "  drain-back [n]      - Take out the last n values (default: all)\n";
            *out_ << "  len / capacity      - Print the number of values / slots reserved\n";
            *out_ << "  reserve <n>         - Make room for n more values\n";
            *out_ << "  next                - Print the key the next insert gets\n";
            *out_ << "  clear               - Drop everything\n";
            *out_ << "  stats               - Print operation counters\n";
            *out_ << "  help                - Show this help\n";
            *out_ << "  exit/quit           - Exit shell\n\n";
        }

    private:

        template <typename FuncT>
        bool with_key(const std::vector<std::string>& args, const char* usage_text, FuncT&& call) {
            if (args.size() < 2) {
                return usage(usage_text);
            }
            auto key = parse_key(args[1]);
            if (!key) {
                *err_ << "Bad key: " << args[1] << "\n";
                return false;
            }
            return call(*key);
        }

        bool usage(const char* text) {
            *err_ << "Usage: " << text << "\n";
            return false;
        }

        bool not_found(entry_key key) {
            *err_ << "No value for key " << key.get() << "\n";
            return false;
        }

        bool cmd_insert(const std::vector<std::string>& args) {
            if (args.size() < 2) {
                return usage("insert <text>");
            }
            std::string text = args[1];
            for (std::size_t i = 2; i < args.size(); ++i) {
                text += ' ';
                text += args[i];
            }
            auto key = store_.insert(std::move(text));
            *out_ << "key " << key.get() << "\n";
            return true;
        }

        bool cmd_get(entry_key key) {
            if (auto value = store_.get(key)) {
                *out_ << *value << "\n";
                return true;
            }
            return not_found(key);
        }

        bool cmd_set(entry_key key, const std::string& text) {
            if (auto value = store_.get_mut(key)) {
                *value = text;
                *out_ << "updated " << key.get() << "\n";
                return true;
            }
            return not_found(key);
        }

        bool cmd_remove(entry_key key) {
            if (auto value = store_.remove(key)) {
                *out_ << "removed " << key.get() << ": " << *value << "\n";
                return true;
            }
            return not_found(key);
        }

        void cmd_list(bool reversed) {
            auto range = store_.iter();
            if (reversed) {
                for (auto it = range.rbegin(); it != range.rend(); ++it) {
                    auto [key, value] = *it;
                    *out_ << key.get() << ": " << value << "\n";
                }
            }
            else {
                for (auto [key, value] : range) {
                    *out_ << key.get() << ": " << value << "\n";
                }
            }
        }

        void cmd_values() {
            for (const auto& value : store_.values()) {
                *out_ << value << "\n";
            }
        }

        bool cmd_drain(const std::vector<std::string>& args, bool from_back) {
            std::size_t limit = store_.len();
            if (args.size() > 1) {
                auto count = parse_count(args[1]);
                if (!count) {
                    return usage(from_back ? "drain-back [n]" : "drain [n]");
                }
                limit = *count;
            }
            auto drain = store_.drain();
            std::size_t taken = 0;
            while (taken < limit) {
                auto value = from_back ? drain.next_back() : drain.next();
                if (!value) {
                    break;
                }
                *out_ << *value << "\n";
                ++taken;
            }
            *out_ << "drained " << taken << ", left " << store_.len() << "\n";
            return true;
        }

        void cmd_stats() {
            const auto& st = store_.get_stats();
            *out_ << "inserts:        " << st.inserts << "\n";
            *out_ << "removes:        " << st.removes << "\n";
            *out_ << "reused slots:   " << st.reused_slots << "\n";
            *out_ << "appended slots: " << st.appended_slots << "\n";
            *out_ << "drained:        " << st.drained << "\n";
            *out_ << "failed lookups: " << st.failed_lookups << "\n";
        }

        std::ostream* out_ = nullptr;
        std::ostream* err_ = nullptr;
        store_type store_;
    };

} // namespace tslab_demo
