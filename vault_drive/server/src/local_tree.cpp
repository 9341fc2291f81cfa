#include "local_tree.hpp"

#include "errors.hpp"
#include "ids.hpp"
#include "logger.hpp"
#include "upload_session.hpp"

#include <sqlite3.h>

#include <chrono>
#include <fstream>
#include <stdexcept>

namespace vault::server {

namespace {

constexpr const char* kRevisionDelimiter = ".REV.";

std::int64_t now_nanos() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::int64_t to_int(const Attributes& attributes, const char* name) {
    auto it = attributes.find(name);
    if (it == attributes.end() || it->second.empty()) {
        return 0;
    }
    return std::stoll(it->second);
}

std::string value_or_empty(const Attributes& attributes, const char* name) {
    auto it = attributes.find(name);
    return it == attributes.end() ? std::string() : it->second;
}

std::string version_key(const std::string& space_id, const std::string& node_id, const std::string& mtime) {
    return space_id + "/" + node_id + kRevisionDelimiter + mtime;
}

std::pair<std::string, std::string> split_version_key(const std::string& versions_path) {
    const auto slash = versions_path.find('/');
    if (slash == std::string::npos || versions_path.find(kRevisionDelimiter, slash) == std::string::npos) {
        throw UploadError(ErrorCode::kInvalidArgument, "malformed versions path: " + versions_path);
    }
    return {versions_path.substr(0, slash), versions_path.substr(slash + 1)};
}

class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw UploadError(ErrorCode::kBackend, "sqlite prepare failed", sqlite3_errmsg(db_));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
        return *this;
    }
    Statement& bind_blob(int index, const std::string& value) {
        sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        return *this;
    }
    Statement& bind(int index, std::int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
        return *this;
    }

    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc != SQLITE_DONE) {
            throw UploadError(ErrorCode::kBackend, "sqlite step failed", sqlite3_errmsg(db_));
        }
        return false;
    }

    std::string text(int column) const {
        const auto* value = sqlite3_column_text(stmt_, column);
        return value ? reinterpret_cast<const char*>(value) : std::string();
    }
    std::string blob(int column) const {
        const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt_, column));
        const int size = sqlite3_column_bytes(stmt_, column);
        return data ? std::string(data, static_cast<std::size_t>(size)) : std::string();
    }
    std::int64_t integer(int column) const { return sqlite3_column_int64(stmt_, column); }

    int changes() const { return sqlite3_changes(db_); }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { run("BEGIN IMMEDIATE"); }
    ~Transaction() {
        if (!done_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    void commit() {
        run("COMMIT");
        done_ = true;
    }

private:
    void run(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw UploadError(ErrorCode::kBackend, std::string("sqlite ") + sql + " failed", msg);
        }
    }

    sqlite3* db_;
    bool done_ = false;
};

}  // namespace

LocalTree::LocalTree(std::filesystem::path root, const std::string& database_path, Logger& logger)
    : root_(std::move(root)), blobs_dir_(root_ / "blobs"), logger_(logger) {
    std::filesystem::create_directories(blobs_dir_);
    const auto parent = std::filesystem::path(database_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    if (sqlite3_open(database_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open tree database: " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
}

LocalTree::~LocalTree() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void LocalTree::initialize_schema() {
    const char* ddl = R"SQL(
        CREATE TABLE IF NOT EXISTS node_attributes (
            space_id TEXT NOT NULL,
            node_id TEXT NOT NULL,
            name TEXT NOT NULL,
            value BLOB,
            PRIMARY KEY(space_id, node_id, name)
        );
        CREATE TABLE IF NOT EXISTS node_links (
            space_id TEXT NOT NULL,
            parent_id TEXT NOT NULL,
            name TEXT NOT NULL,
            node_id TEXT NOT NULL,
            PRIMARY KEY(space_id, parent_id, name)
        );
        CREATE TABLE IF NOT EXISTS recycle_items (
            space_id TEXT NOT NULL,
            item_key TEXT NOT NULL,
            node_id TEXT NOT NULL,
            parent_id TEXT NOT NULL,
            name TEXT NOT NULL,
            deleted_at INTEGER NOT NULL,
            PRIMARY KEY(space_id, item_key)
        );
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    exec(ddl);
}

void LocalTree::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Failed to initialize tree schema: " + msg);
    }
}

Attributes LocalTree::load_attributes(const std::string& space_id, const std::string& node_id) {
    Statement stmt(db_, "SELECT name,value FROM node_attributes WHERE space_id=? AND node_id=?");
    stmt.bind(1, space_id).bind(2, node_id);
    Attributes attributes;
    while (stmt.step()) {
        attributes.emplace(stmt.text(0), stmt.blob(1));
    }
    return attributes;
}

void LocalTree::store_attribute(const std::string& space_id, const std::string& node_id, const std::string& name,
                                const std::string& value) {
    Statement stmt(db_, "INSERT OR REPLACE INTO node_attributes(space_id,node_id,name,value) VALUES(?,?,?,?)");
    stmt.bind(1, space_id).bind(2, node_id).bind(3, name).bind_blob(4, value);
    stmt.step();
}

void LocalTree::erase_attribute(const std::string& space_id, const std::string& node_id, const std::string& name) {
    Statement stmt(db_, "DELETE FROM node_attributes WHERE space_id=? AND node_id=? AND name=?");
    stmt.bind(1, space_id).bind(2, node_id).bind(3, name);
    stmt.step();
}

bool LocalTree::erase_attributes(const std::string& space_id, const std::string& node_id) {
    Statement stmt(db_, "DELETE FROM node_attributes WHERE space_id=? AND node_id=?");
    stmt.bind(1, space_id).bind(2, node_id);
    stmt.step();
    return stmt.changes() > 0;
}

std::optional<std::string> LocalTree::lookup_link(const std::string& space_id, const std::string& parent_id,
                                                  const std::string& name) {
    Statement stmt(db_, "SELECT node_id FROM node_links WHERE space_id=? AND parent_id=? AND name=?");
    stmt.bind(1, space_id).bind(2, parent_id).bind(3, name);
    if (stmt.step()) {
        return stmt.text(0);
    }
    return std::nullopt;
}

void LocalTree::insert_link(const std::string& space_id, const std::string& parent_id, const std::string& name,
                            const std::string& node_id) {
    Statement stmt(db_, "INSERT INTO node_links(space_id,parent_id,name,node_id) VALUES(?,?,?,?)");
    stmt.bind(1, space_id).bind(2, parent_id).bind(3, name).bind(4, node_id);
    stmt.step();
}

bool LocalTree::erase_link(const std::string& space_id, const std::string& parent_id, const std::string& name) {
    Statement stmt(db_, "DELETE FROM node_links WHERE space_id=? AND parent_id=? AND name=?");
    stmt.bind(1, space_id).bind(2, parent_id).bind(3, name);
    stmt.step();
    return stmt.changes() > 0;
}

std::vector<std::string> LocalTree::child_ids(const std::string& space_id, const std::string& parent_id) {
    Statement stmt(db_, "SELECT node_id FROM node_links WHERE space_id=? AND parent_id=? ORDER BY name");
    stmt.bind(1, space_id).bind(2, parent_id);
    std::vector<std::string> ids;
    while (stmt.step()) {
        ids.push_back(stmt.text(0));
    }
    return ids;
}

std::optional<LocalTree::RecycleItem> LocalTree::load_recycle_item(const std::string& space_id,
                                                                  const std::string& key) {
    Statement stmt(db_, "SELECT node_id,parent_id,name FROM recycle_items WHERE space_id=? AND item_key=?");
    stmt.bind(1, space_id).bind(2, key);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return RecycleItem{stmt.text(0), stmt.text(1), stmt.text(2)};
}

Node LocalTree::node_locked(const std::string& space_id, const std::string& node_id) {
    const auto attributes = load_attributes(space_id, node_id);
    if (attributes.find(attrs::kType) == attributes.end()) {
        throw UploadError(ErrorCode::kNotFound, "node " + space_id + "!" + node_id + " not found");
    }
    Node node;
    node.space_id = space_id;
    node.id = node_id;
    node.parent_id = value_or_empty(attributes, attrs::kParentId);
    node.name = value_or_empty(attributes, attrs::kName);
    node.type = attributes.at(attrs::kType) == attrs::kTypeDirectory ? NodeType::kDirectory : NodeType::kFile;
    node.blob_id = value_or_empty(attributes, attrs::kBlobId);
    node.blob_size = to_int(attributes, attrs::kBlobSize);
    return node;
}

std::int64_t LocalTree::node_size(const Node& node, const Attributes& attributes) const {
    return node.type == NodeType::kDirectory ? to_int(attributes, attrs::kTreeSize) : node.blob_size;
}

void LocalTree::require_directory(const std::string& space_id, const std::string& node_id) {
    const auto parent = node_locked(space_id, node_id);
    if (parent.type != NodeType::kDirectory) {
        throw UploadError(ErrorCode::kPrecondition, "node " + node_id + " is not a directory");
    }
}

void LocalTree::propagate_from(const std::string& space_id, const std::string& start_id, std::int64_t size_diff) {
    const std::string mtime = std::to_string(now_nanos());
    std::string current = start_id;
    while (!current.empty()) {
        const auto attributes = load_attributes(space_id, current);
        if (attributes.find(attrs::kType) == attributes.end()) {
            throw UploadError(ErrorCode::kNotFound, "ancestor " + current + " vanished during propagation");
        }
        const auto tree_size = to_int(attributes, attrs::kTreeSize) + size_diff;
        store_attribute(space_id, current, attrs::kTreeSize, std::to_string(tree_size < 0 ? 0 : tree_size));
        store_attribute(space_id, current, attrs::kMTime, mtime);
        current = value_or_empty(attributes, attrs::kParentId);
    }
}

Node LocalTree::create_space(const std::string& space_id, const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);
    if (load_attributes(space_id, space_id).empty()) {
        store_attribute(space_id, space_id, attrs::kType, attrs::kTypeDirectory);
        store_attribute(space_id, space_id, attrs::kName, space_id);
        store_attribute(space_id, space_id, attrs::kTreeSize, "0");
        store_attribute(space_id, space_id, attrs::kMTime, std::to_string(now_nanos()));
        store_attribute(space_id, space_id, attrs::kOwner, owner);
    }
    txn.commit();
    return node_locked(space_id, space_id);
}

void LocalTree::set_attribute(const Node& node, const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    node_locked(node.space_id, node.id);
    store_attribute(node.space_id, node.id, name, value);
}

std::optional<Node> LocalTree::find_child(const std::string& space_id, const std::string& parent_id,
                                          const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = lookup_link(space_id, parent_id, name);
    if (!id) {
        return std::nullopt;
    }
    return node_locked(space_id, *id);
}

bool LocalTree::version_exists(const std::string& versions_path) {
    const auto [space_id, key] = split_version_key(versions_path);
    std::lock_guard<std::mutex> lock(mutex_);
    return !load_attributes(space_id, key).empty();
}

std::filesystem::path LocalTree::blob_path(const Node& node) const {
    if (node.blob_id.empty()) {
        throw UploadError(ErrorCode::kInvalidArgument, "node " + node.id + " has no blob id");
    }
    return blobs_dir_ / node.blob_id;
}

std::vector<RecycleEntry> LocalTree::list_recycle(const std::string& space_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   "SELECT item_key,node_id,name,deleted_at FROM recycle_items WHERE space_id=? ORDER BY deleted_at");
    stmt.bind(1, space_id);
    std::vector<RecycleEntry> entries;
    while (stmt.step()) {
        entries.push_back(RecycleEntry{stmt.text(0), stmt.text(1), stmt.text(2), stmt.integer(3)});
    }
    return entries;
}

NodeInfo LocalTree::get_md(const Node& node) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto current = node_locked(node.space_id, node.id);
    const auto attributes = load_attributes(node.space_id, node.id);
    NodeInfo info;
    info.name = current.name;
    info.is_directory = current.type == NodeType::kDirectory;
    info.size = node_size(current, attributes);
    info.mtime = to_int(attributes, attrs::kMTime);
    return info;
}

std::vector<Node> LocalTree::list_folder(const Node& node) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_directory(node.space_id, node.id);
    std::vector<Node> children;
    for (const auto& id : child_ids(node.space_id, node.id)) {
        children.push_back(node_locked(node.space_id, id));
    }
    return children;
}

void LocalTree::create_dir(const Node& node) {
    if (node.id.empty() || node.name.empty() || node.parent_id.empty()) {
        throw UploadError(ErrorCode::kInvalidArgument, "directory needs id, name and parent");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);
    require_directory(node.space_id, node.parent_id);
    if (lookup_link(node.space_id, node.parent_id, node.name)) {
        throw UploadError(ErrorCode::kPrecondition, node.name + " already exists");
    }
    insert_link(node.space_id, node.parent_id, node.name, node.id);
    store_attribute(node.space_id, node.id, attrs::kType, attrs::kTypeDirectory);
    store_attribute(node.space_id, node.id, attrs::kName, node.name);
    store_attribute(node.space_id, node.id, attrs::kParentId, node.parent_id);
    store_attribute(node.space_id, node.id, attrs::kTreeSize, "0");
    store_attribute(node.space_id, node.id, attrs::kMTime, std::to_string(now_nanos()));
    propagate_from(node.space_id, node.parent_id, 0);
    txn.commit();
}

void LocalTree::move(const Node& old_node, const Node& new_node) {
    if (old_node.space_id != new_node.space_id) {
        throw UploadError(ErrorCode::kInvalidArgument, "cross-space moves are not supported");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);
    const auto current = node_locked(old_node.space_id, old_node.id);
    require_directory(new_node.space_id, new_node.parent_id);
    if (lookup_link(new_node.space_id, new_node.parent_id, new_node.name)) {
        throw UploadError(ErrorCode::kPrecondition, new_node.name + " already exists");
    }
    const auto size = node_size(current, load_attributes(current.space_id, current.id));

    erase_link(current.space_id, current.parent_id, current.name);
    insert_link(current.space_id, new_node.parent_id, new_node.name, current.id);
    store_attribute(current.space_id, current.id, attrs::kName, new_node.name);
    store_attribute(current.space_id, current.id, attrs::kParentId, new_node.parent_id);

    if (current.parent_id != new_node.parent_id) {
        propagate_from(current.space_id, current.parent_id, -size);
        propagate_from(current.space_id, new_node.parent_id, size);
    } else {
        propagate_from(current.space_id, current.parent_id, 0);
    }
    txn.commit();
}

void LocalTree::remove(const Node& node) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);
    const auto current = node_locked(node.space_id, node.id);
    if (current.is_space_root()) {
        throw UploadError(ErrorCode::kPrecondition, "space roots cannot be deleted");
    }
    const auto size = node_size(current, load_attributes(current.space_id, current.id));
    const std::string key = util::random_id();

    erase_link(current.space_id, current.parent_id, current.name);
    Statement stmt(db_,
                   "INSERT INTO recycle_items(space_id,item_key,node_id,parent_id,name,deleted_at) "
                   "VALUES(?,?,?,?,?,?)");
    stmt.bind(1, current.space_id)
        .bind(2, key)
        .bind(3, current.id)
        .bind(4, current.parent_id)
        .bind(5, current.name)
        .bind(6, now_nanos());
    stmt.step();
    propagate_from(current.space_id, current.parent_id, -size);
    txn.commit();
    logger_.info("moved node " + current.id + " to recycle bin as " + key);
}

RestorePlan LocalTree::restore_recycle_item(const std::string& space_id, const std::string& key,
                                            const Node* target) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto item = load_recycle_item(space_id, key);
    if (!item) {
        throw UploadError(ErrorCode::kNotFound, "recycle item " + key + " not found");
    }

    RestorePlan plan;
    plan.restored = node_locked(space_id, item->node_id);
    const bool relocate = target != nullptr && !target->parent_id.empty();
    plan.parent = node_locked(space_id, relocate ? target->parent_id : item->parent_id);
    if (plan.parent.type != NodeType::kDirectory) {
        throw UploadError(ErrorCode::kPrecondition, "restore target " + plan.parent.id + " is not a directory");
    }
    plan.restored.parent_id = plan.parent.id;
    if (target != nullptr && !target->name.empty()) {
        plan.restored.name = target->name;
    }
    if (lookup_link(space_id, plan.restored.parent_id, plan.restored.name)) {
        throw UploadError(ErrorCode::kPrecondition, plan.restored.name + " already exists");
    }

    const Node restored = plan.restored;
    plan.commit = PendingCommit([this, restored, key]() {
        std::lock_guard<std::mutex> commit_lock(mutex_);
        Transaction txn(db_);
        if (!load_recycle_item(restored.space_id, key)) {
            throw UploadError(ErrorCode::kNotFound, "recycle item " + key + " vanished before restore");
        }
        insert_link(restored.space_id, restored.parent_id, restored.name, restored.id);
        store_attribute(restored.space_id, restored.id, attrs::kName, restored.name);
        store_attribute(restored.space_id, restored.id, attrs::kParentId, restored.parent_id);
        Statement stmt(db_, "DELETE FROM recycle_items WHERE space_id=? AND item_key=?");
        stmt.bind(1, restored.space_id).bind(2, key);
        stmt.step();
        const auto size = node_size(restored, load_attributes(restored.space_id, restored.id));
        propagate_from(restored.space_id, restored.parent_id, size);
        txn.commit();
    });
    return plan;
}

PurgePlan LocalTree::purge_recycle_item(const std::string& space_id, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto item = load_recycle_item(space_id, key);
    if (!item) {
        throw UploadError(ErrorCode::kNotFound, "recycle item " + key + " not found");
    }

    PurgePlan plan;
    plan.purged = node_locked(space_id, item->node_id);
    plan.commit = PendingCommit([this, space_id, key, root_id = item->node_id]() {
        std::vector<std::filesystem::path> blobs;
        {
            std::lock_guard<std::mutex> commit_lock(mutex_);
            Transaction txn(db_);
            std::vector<std::string> pending{root_id};
            while (!pending.empty()) {
                const std::string id = pending.back();
                pending.pop_back();
                const auto node = node_locked(space_id, id);
                for (const auto& child : child_ids(space_id, id)) {
                    pending.push_back(child);
                    erase_link(space_id, id, node_locked(space_id, child).name);
                }
                if (!node.blob_id.empty()) {
                    blobs.push_back(blob_path(node));
                }
                erase_attributes(space_id, id);
            }
            Statement stmt(db_, "DELETE FROM recycle_items WHERE space_id=? AND item_key=?");
            stmt.bind(1, space_id).bind(2, key);
            stmt.step();
            txn.commit();
        }
        for (const auto& blob : blobs) {
            std::error_code ec;
            std::filesystem::remove(blob, ec);
            if (ec) {
                logger_.warn("failed to remove purged blob " + blob.string() + ": " + ec.message());
            }
        }
    });
    return plan;
}

void LocalTree::write_blob(const Node& node, const std::filesystem::path& bin_path) {
    const auto target = blob_path(node);
    std::error_code ec;
    if (!std::filesystem::exists(bin_path, ec)) {
        throw UploadError(ErrorCode::kNotFound, "staged upload " + bin_path.string() + " does not exist");
    }
    const auto tmp = target.string() + ".tmp";
    std::filesystem::copy_file(bin_path, tmp, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw UploadError(ErrorCode::kBackend, "copying " + bin_path.string() + " into blob store failed",
                          ec.message());
    }
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::filesystem::remove(tmp);
        throw UploadError(ErrorCode::kBackend, "publishing blob " + node.blob_id + " failed", ec.message());
    }
}

std::unique_ptr<std::istream> LocalTree::read_blob(const Node& node) {
    const auto path = blob_path(node);
    auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!stream->is_open()) {
        throw UploadError(ErrorCode::kNotFound, "blob " + node.blob_id + " not found");
    }
    return stream;
}

void LocalTree::delete_blob(const Node& node) {
    std::error_code ec;
    std::filesystem::remove(blob_path(node), ec);
    if (ec) {
        throw UploadError(ErrorCode::kBackend, "deleting blob " + node.blob_id + " failed", ec.message());
    }
}

void LocalTree::propagate(const Node& node, std::int64_t size_diff) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);
    propagate_from(node.space_id, node.parent_id, size_diff);
    txn.commit();
}

Node LocalTree::read_node(const std::string& space_id, const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return node_locked(space_id, node_id);
}

Attributes LocalTree::attributes(const Node& node) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_attributes(node.space_id, node.id);
}

Node LocalTree::create_node_for_upload(UploadSession& session, const Attributes& checksums) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);
    const std::string& space_id = session.space_root;
    require_directory(space_id, session.node_parent_id);

    std::string node_id;
    std::string versions_path;
    std::int64_t size_diff = session.size;

    if (const auto existing = lookup_link(space_id, session.node_parent_id, session.filename)) {
        const auto old_node = node_locked(space_id, *existing);
        if (old_node.type != NodeType::kFile) {
            throw UploadError(ErrorCode::kPrecondition, session.filename + " is a directory");
        }
        const auto old_attributes = load_attributes(space_id, old_node.id);
        node_id = old_node.id;
        versions_path = version_key(space_id, node_id, value_or_empty(old_attributes, attrs::kMTime));
        const auto version_id = split_version_key(versions_path).second;
        for (const auto& [name, value] : old_attributes) {
            store_attribute(space_id, version_id, name, value);
        }
        size_diff = session.size - old_node.blob_size;
    } else {
        node_id = session.node_id.empty() ? util::random_id() : session.node_id;
        insert_link(space_id, session.node_parent_id, session.filename, node_id);
    }

    const std::string blob_id = session.blob_id.empty() ? util::random_id() : session.blob_id;
    store_attribute(space_id, node_id, attrs::kType, attrs::kTypeFile);
    store_attribute(space_id, node_id, attrs::kName, session.filename);
    store_attribute(space_id, node_id, attrs::kParentId, session.node_parent_id);
    store_attribute(space_id, node_id, attrs::kBlobId, blob_id);
    store_attribute(space_id, node_id, attrs::kBlobSize, std::to_string(session.size));
    store_attribute(space_id, node_id, attrs::kMTime, std::to_string(now_nanos()));
    store_attribute(space_id, node_id, attrs::kProcessing, session.id);
    for (const auto& [name, value] : checksums) {
        store_attribute(space_id, node_id, name, value);
    }
    txn.commit();

    session.node_id = node_id;
    session.blob_id = blob_id;
    session.versions_path = versions_path;
    session.size_diff = size_diff;
    return node_locked(space_id, node_id);
}

void LocalTree::remove_node(const Node& node) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);
    const bool had_attributes = erase_attributes(node.space_id, node.id);
    const bool had_link = erase_link(node.space_id, node.parent_id, node.name);
    txn.commit();
    if (!had_attributes || !had_link) {
        throw UploadError(ErrorCode::kNotFound, "node " + node.id + " was only partially present");
    }
}

void LocalTree::restore_version(const std::string& versions_path, const Node& node, const AttributeFilter& filter) {
    const auto [space_id, version_id] = split_version_key(versions_path);
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);
    const auto snapshot = load_attributes(space_id, version_id);
    if (snapshot.empty()) {
        throw UploadError(ErrorCode::kNotFound, "version " + versions_path + " not found");
    }
    for (const auto& [name, value] : snapshot) {
        if (filter(name, value)) {
            store_attribute(node.space_id, node.id, name, value);
        }
    }
    txn.commit();
}

void LocalTree::remove_version(const std::string& versions_path) {
    const auto [space_id, version_id] = split_version_key(versions_path);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!erase_attributes(space_id, version_id)) {
        throw UploadError(ErrorCode::kNotFound, "version " + versions_path + " not found");
    }
}

void LocalTree::unmark_processing(const Node& node, const std::string& upload_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto attributes = load_attributes(node.space_id, node.id);
    const auto it = attributes.find(attrs::kProcessing);
    if (it == attributes.end()) {
        return;
    }
    if (it->second != upload_id) {
        throw UploadError(ErrorCode::kPrecondition,
                          "node " + node.id + " is processing upload " + it->second + ", not " + upload_id);
    }
    erase_attribute(node.space_id, node.id, attrs::kProcessing);
}

}  // namespace vault::server
