// path_builder.cpp - Change location construction

#include <tree_diff/options.h>
#include <tree_diff/path_builder.h>

namespace tree_diff {

namespace {

void append_key_text(std::string& text, std::string_view key, std::string_view delimiter)
{
    if (!text.empty()) {
        text += delimiter;
    }
    text += key;
}

void append_index_text(std::string& text, std::size_t index)
{
    text += '[';
    text += std::to_string(index);
    text += ']';
}

} // anonymous namespace

DiffPath root_path(const DiffOptions& options)
{
    if (options.array_path) {
        return PathTokens{};
    }
    return std::string{};
}

// The prefix keeps its form: a run started from root_path() never mixes forms.
DiffPath append_key(const DiffPath& prefix, std::string_view key, const DiffOptions& options)
{
    if (auto* tokens = std::get_if<PathTokens>(&prefix)) {
        PathTokens result = *tokens;
        result.emplace_back(std::string{key});
        return result;
    }
    std::string result = std::get<std::string>(prefix);
    append_key_text(result, key, options.delimiter);
    return result;
}

DiffPath append_index(const DiffPath& prefix, std::size_t index, const DiffOptions& /*options*/)
{
    if (auto* tokens = std::get_if<PathTokens>(&prefix)) {
        PathTokens result = *tokens;
        result.emplace_back(index);
        return result;
    }
    std::string result = std::get<std::string>(prefix);
    append_index_text(result, index);
    return result;
}

std::string path_to_string(const DiffPath& path, std::string_view delimiter)
{
    if (auto* text = std::get_if<std::string>(&path)) {
        return *text;
    }
    std::string result;
    for (const auto& elem : std::get<PathTokens>(path)) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                append_key_text(result, v, delimiter);
            } else {
                append_index_text(result, v);
            }
        }, elem);
    }
    return result;
}

bool is_root(const DiffPath& path) noexcept
{
    return std::visit([](const auto& p) { return p.empty(); }, path);
}

} // namespace tree_diff
