#include "config/toml_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace sqlanon::toml_utils {

namespace {

constexpr int kMaxIncludeDepth = 10;

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// Takes the include directive out of @p root, paths in declaration order
std::vector<std::string> take_include_paths(toml::table& root) {
    auto inc_node = root["include"];
    if (!inc_node) return {};

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (!item.is_string()) {
                throw std::runtime_error("Config include entries must be strings");
            }
            paths.emplace_back(item.as_string()->get());
        }
    } else {
        throw std::runtime_error("Config include must be a string or an array of strings");
    }
    root.erase("include");
    return paths;
}

void check_include_depth(const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format(
            "Config include depth exceeds {}, possible circular include", kMaxIncludeDepth));
    }
}

std::string visit_include(const std::string& base_dir, const std::string& rel_path,
                          std::unordered_set<std::string>& visited) {
    namespace fs = std::filesystem;
    std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();
    if (!visited.insert(abs_path).second) {
        throw std::runtime_error(
            std::format("Circular config include detected: {}", abs_path));
    }
    return abs_path;
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    check_include_depth(depth);

    for (const auto& rel_path : take_include_paths(root)) {
        const std::string abs_path = visit_include(base_dir, rel_path, visited);

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = std::filesystem::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file overrides it
        merge_tables(included, root);
        root = std::move(included);
    }
}

void collect_documents(const std::string& path, toml::table root,
                       std::unordered_set<std::string>& visited, const int depth,
                       std::vector<Document>& out) {
    check_include_depth(depth);

    const std::string base_dir = std::filesystem::path(path).parent_path().string();
    for (const auto& rel_path : take_include_paths(root)) {
        const std::string abs_path = visit_include(base_dir, rel_path, visited);
        collect_documents(abs_path, toml::parse_file(abs_path), visited, depth + 1, out);
    }

    expand_env_vars_recursive(root);
    out.push_back(Document{path, std::move(root)});
}

using Position = std::pair<uint32_t, uint32_t>;

std::optional<Position> first_position(const toml::key& key, const toml::node& node) {
    std::optional<Position> best;
    const auto consider = [&best](const toml::source_position& pos) {
        if (!pos) return;
        const Position candidate{pos.line, pos.column};
        if (!best || candidate < *best) {
            best = candidate;
        }
    };

    consider(key.source().begin);
    if (const auto* tbl = node.as_table()) {
        for (const auto& [child, value] : *tbl) {
            consider(child.source().begin);
        }
    }
    return best;
}

template<typename T>
std::string to_toml_text(const T& value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

} // anonymous namespace

std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

toml::table parse_string(std::string_view content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

std::vector<Document> parse_documents(const std::string& file_path) {
    std::unordered_set<std::string> visited;
    visited.insert(std::filesystem::canonical(file_path).string());

    std::vector<Document> documents;
    collect_documents(file_path, toml::parse_file(file_path), visited, 0, documents);
    return documents;
}

nlohmann::json to_json(const toml::node& node) {
    if (const auto* tbl = node.as_table()) {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& [key, value] : *tbl) {
            obj[std::string(key.str())] = to_json(value);
        }
        return obj;
    }
    if (const auto* arr = node.as_array()) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& elem : *arr) {
            list.push_back(to_json(elem));
        }
        return list;
    }
    if (const auto* s = node.as_string())         return s->get();
    if (const auto* i = node.as_integer())        return i->get();
    if (const auto* f = node.as_floating_point()) return f->get();
    if (const auto* b = node.as_boolean())        return b->get();
    if (const auto* d = node.as_date())           return to_toml_text(*d);
    if (const auto* t = node.as_time())           return to_toml_text(*t);
    if (const auto* dt = node.as_date_time())     return to_toml_text(*dt);
    return nullptr;
}

std::vector<std::pair<std::string, const toml::node*>> in_source_order(const toml::table& table) {
    struct Item {
        std::string key;
        const toml::node* node;
        std::optional<Position> position;
    };

    std::vector<Item> items;
    items.reserve(table.size());
    for (const auto& [key, value] : table) {
        items.push_back(Item{std::string(key.str()), &value, first_position(key, value)});
    }

    // Entries without a source position (built in code) keep key order, last
    std::stable_sort(items.begin(), items.end(), [](const Item& a, const Item& b) {
        if (!a.position) return false;
        if (!b.position) return true;
        return *a.position < *b.position;
    });

    std::vector<std::pair<std::string, const toml::node*>> result;
    result.reserve(items.size());
    for (auto& item : items) {
        result.emplace_back(std::move(item.key), item.node);
    }
    return result;
}

std::optional<std::string> optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

} // namespace sqlanon::toml_utils
