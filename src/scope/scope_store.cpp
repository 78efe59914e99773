#include "attest/scope.hpp"

#include "attest/json.hpp"
#include "attest/platform.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace attest {

namespace {

constexpr const char* SCOPE_SCHEMA = "attest.scope.v1";

std::string scope_meta_json(const std::string& name, const std::optional<std::string>& parent) {
    json::json j;
    j["$schema"] = SCOPE_SCHEMA;
    j["name"] = name;
    j["parent"] = parent ? json::json(*parent) : json::json(nullptr);
    return j.dump(2);
}

Error io_error(const std::string& message) {
    return Error(ErrorCode::IO_ERROR, message);
}

} // namespace

ScopeStore::ScopeStore(std::string dir) : dir_(std::move(dir)) {}

std::string ScopeStore::tree_path() const { return join_path(dir_, "tree.json"); }
std::string ScopeStore::chain_path() const { return join_path(dir_, "chain.log"); }
std::string ScopeStore::meta_path() const { return join_path(dir_, "scope.json"); }

bool ScopeStore::exists() const {
    return path_exists(chain_path());
}

Result<void> ScopeStore::create(const std::string& name,
                                const std::optional<std::string>& parent,
                                const ProvenanceRecord& genesis) {
    if (exists()) {
        return Result<void>::err(Error(ErrorCode::SCOPE_EXISTS,
            "scope already stored at " + dir_));
    }
    if (!create_directories(dir_)) {
        return Result<void>::err(io_error("failed to create " + dir_));
    }

    auto meta = atomic_write_file(meta_path(), scope_meta_json(name, parent));
    if (!meta.ok) {
        return Result<void>::err(io_error(meta.error));
    }

    auto tree = atomic_write_file(tree_path(),
                                  json::tree_snapshot_to_json(TreeSnapshot{}).dump(2));
    if (!tree.ok) {
        return Result<void>::err(io_error(tree.error));
    }

    auto log = append_line_durable(chain_path(), json::record_to_line(genesis));
    if (!log.ok) {
        return Result<void>::err(io_error(log.error));
    }
    return Result<void>::ok();
}

Result<void> ScopeStore::persist(const TreeSnapshot& tree, const ProvenanceRecord& record) {
    auto temp = write_temp_file(tree_path(), json::tree_snapshot_to_json(tree).dump(2));
    if (!temp.ok) {
        return Result<void>::err(io_error("tree snapshot: " + temp.error));
    }

    auto log_size = file_size(chain_path());
    if (!log_size) {
        remove_file(temp.temp_path);
        return Result<void>::err(io_error("cannot stat " + chain_path()));
    }

    auto appended = append_line_durable(chain_path(), json::record_to_line(record));
    if (!appended.ok) {
        remove_file(temp.temp_path);
        // A partial line may have reached the log
        auto truncated = truncate_file(chain_path(), *log_size);
        if (!truncated.ok) {
            spdlog::error("cannot restore {} after failed append: {}", chain_path(), truncated.error);
        }
        return Result<void>::err(io_error(appended.error));
    }

    auto renamed = commit_temp_file(temp.temp_path, tree_path());
    if (!renamed.ok) {
        auto truncated = truncate_file(chain_path(), *log_size);
        if (!truncated.ok) {
            spdlog::error("cannot truncate {} back to {} bytes: {}",
                          chain_path(), *log_size, truncated.error);
        }
        return Result<void>::err(io_error(renamed.error));
    }
    return Result<void>::ok();
}

Result<ScopeStore::Loaded> ScopeStore::load() const {
    Loaded loaded;

    auto meta_str = read_file(meta_path());
    if (!meta_str) {
        return Result<Loaded>::err(io_error("cannot read " + meta_path()));
    }
    try {
        auto meta = json::json::parse(*meta_str);
        if (!meta.is_object() || meta.value("$schema", "") != SCOPE_SCHEMA ||
            !meta.contains("name") || !meta["name"].is_string()) {
            return Result<Loaded>::err(Error(ErrorCode::PARSE_ERROR,
                meta_path() + ": not an " + SCOPE_SCHEMA + " document"));
        }
        loaded.name = meta["name"].get<std::string>();
        if (meta.contains("parent") && meta["parent"].is_string()) {
            loaded.parent = meta["parent"].get<std::string>();
        }
    } catch (const json::json::exception& e) {
        return Result<Loaded>::err(Error(ErrorCode::PARSE_ERROR,
            meta_path() + ": " + e.what()));
    }

    auto log = read_file(chain_path());
    if (!log) {
        return Result<Loaded>::err(io_error("cannot read " + chain_path()));
    }
    std::istringstream lines(*log);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(lines, line)) {
        ++line_no;
        if (line.empty()) continue;
        auto rec = json::parse_record_line(line);
        if (!rec.ok) {
            return Result<Loaded>::err(Error(ErrorCode::PARSE_ERROR,
                chain_path() + ":" + std::to_string(line_no) + ": " + rec.error));
        }
        loaded.records.push_back(std::move(rec.value));
    }
    if (loaded.records.empty()) {
        return Result<Loaded>::err(Error(ErrorCode::CHAIN_EMPTY,
            chain_path() + " has no genesis record"));
    }

    auto tree_str = read_file(tree_path());
    if (!tree_str) {
        return Result<Loaded>::err(io_error("cannot read " + tree_path()));
    }
    auto tree = json::parse_tree_snapshot(*tree_str);
    if (!tree.ok) {
        return Result<Loaded>::err(Error(ErrorCode::PARSE_ERROR,
            tree_path() + ": " + tree.error));
    }
    loaded.tree = std::move(tree.value);

    return Result<Loaded>::ok(std::move(loaded));
}

} // namespace attest
