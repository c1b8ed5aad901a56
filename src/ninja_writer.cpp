#include "kninja/ninja_writer.hpp"

#include <format>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace kninja {

namespace {

// Number of consecutive '$' immediately before `index`. An odd count means
// the character at `index` is escaped.
size_t dollars_before(std::string_view text, size_t index) {
    size_t count = 0;
    while (index > 0 && text[index - 1] == '$') {
        ++count;
        --index;
    }
    return count;
}

std::string join_words(const std::vector<std::string> &words) {
    std::string out;
    for (const auto &w : words) {
        if (w.empty())
            continue;
        if (!out.empty())
            out += ' ';
        out += w;
    }
    return out;
}

} // namespace

std::string escape_path(std::string_view word) {
    std::string out;
    out.reserve(word.size());
    for (size_t i = 0; i < word.size(); ++i) {
        char c = word[i];
        if (c == '$' && i + 1 < word.size() && word[i + 1] == ' ') {
            // literal '$' followed by an escaped space
            out += "$$$ ";
            ++i;
            continue;
        }
        if (c == ' ' || c == ':') {
            out += '$';
        }
        out += c;
    }
    return out;
}

std::string escape(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '$')
            out += '$';
        out += c;
    }
    return out;
}

void NinjaWriter::newline() {
    out_ << '\n';
}

void NinjaWriter::comment(std::string_view text) {
    std::string_view rest = text;
    const size_t avail = width_ > 2 ? width_ - 2 : 1;
    while (rest.size() > avail) {
        size_t cut = rest.rfind(' ', avail);
        if (cut == std::string_view::npos || cut == 0) {
            cut = rest.find(' ', avail);
            if (cut == std::string_view::npos)
                break;
        }
        out_ << "# " << rest.substr(0, cut) << '\n';
        rest = rest.substr(cut + 1);
    }
    out_ << "# " << rest << '\n';
}

void NinjaWriter::variable(std::string_view key, std::string_view value, size_t indent) {
    line(std::format("{} = {}", key, value), indent);
}

void NinjaWriter::variable(std::string_view key, const std::vector<std::string> &values, size_t indent) {
    variable(key, join_words(values), indent);
}

void NinjaWriter::pool(std::string_view name, unsigned depth) {
    line(std::format("pool {}", name));
    variable("depth", std::to_string(depth), 1);
}

void NinjaWriter::rule(std::string_view name, std::string_view command, const std::optional<std::string> &description) {
    line(std::format("rule {}", name));
    variable("command", command, 1);
    if (description && !description->empty()) {
        variable("description", *description, 1);
    }
}

void NinjaWriter::build(const std::vector<std::string> &outputs, std::string_view rule,
                        const std::vector<std::string> &inputs, const std::vector<std::string> &implicit,
                        const std::vector<std::string> &order_only, const std::map<std::string, std::string> &variables,
                        const std::vector<std::string> &implicit_outputs, const std::optional<std::string> &pool) {
    std::string text = "build";
    auto append = [&text](const std::vector<std::string> &paths) {
        for (const auto &p : paths) {
            if (p.empty())
                continue;
            text += ' ';
            text += escape_path(p);
        }
    };

    append(outputs);
    if (!implicit_outputs.empty()) {
        text += " |";
        append(implicit_outputs);
    }
    text += ": ";
    text += rule;
    append(inputs);
    if (!implicit.empty()) {
        text += " |";
        append(implicit);
    }
    if (!order_only.empty()) {
        text += " ||";
        append(order_only);
    }
    line(std::move(text));

    if (pool) {
        variable("pool", *pool, 1);
    }
    for (const auto &[key, value] : variables) {
        variable(key, value, 1);
    }
}

void NinjaWriter::default_targets(const std::vector<std::string> &paths) {
    std::string text = "default";
    for (const auto &p : paths) {
        text += ' ';
        text += escape_path(p);
    }
    line(std::move(text));
}

void NinjaWriter::line(std::string text, size_t indent) {
    std::string leading(indent * 2, ' ');
    while (leading.size() + text.size() > width_) {
        // Leave room for the " $" continuation marker.
        const size_t available = width_ > leading.size() + 2 ? width_ - leading.size() - 2 : 0;

        // Break at the last unescaped space that fits, or failing that the
        // first unescaped space past the limit.
        size_t space = available;
        while (true) {
            space = space == 0 ? std::string::npos : text.rfind(' ', space - 1);
            if (space == std::string::npos || dollars_before(text, space) % 2 == 0)
                break;
        }
        if (space == std::string::npos) {
            space = available > 0 ? available - 1 : 0;
            while (true) {
                space = text.find(' ', space + 1);
                if (space == std::string::npos || dollars_before(text, space) % 2 == 0)
                    break;
            }
        }
        if (space == std::string::npos)
            break;

        out_ << leading << std::string_view(text).substr(0, space) << " $\n";
        text.erase(0, space + 1);
        leading.assign((indent + 2) * 2, ' ');
    }
    out_ << leading << text << '\n';
}

} // namespace kninja
