#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vault::server {

struct UploadSession;

namespace attrs {
inline constexpr const char* kChecksumPrefix = "checksum.";
inline constexpr const char* kChecksumSha1 = "checksum.sha1";
inline constexpr const char* kChecksumMd5 = "checksum.md5";
inline constexpr const char* kChecksumAdler32 = "checksum.adler32";
inline constexpr const char* kType = "type";
inline constexpr const char* kBlobId = "blobid";
inline constexpr const char* kBlobSize = "blobsize";
inline constexpr const char* kMTime = "mtime";
inline constexpr const char* kTreeSize = "treesize";
inline constexpr const char* kProcessing = "processing";
inline constexpr const char* kName = "name";
inline constexpr const char* kParentId = "parentid";
inline constexpr const char* kOwner = "owner";

inline constexpr const char* kTypeFile = "file";
inline constexpr const char* kTypeDirectory = "dir";
}  // namespace attrs

// Attribute values are raw bytes.
using Attributes = std::map<std::string, std::string>;

// Decides whether an attribute is copied.
using AttributeFilter = std::function<bool(const std::string& name, const std::string& value)>;

enum class NodeType {
    kFile,
    kDirectory,
};

struct Node {
    std::string space_id;
    std::string id;
    std::string parent_id;
    std::string name;
    NodeType type = NodeType::kFile;
    std::string blob_id;
    std::int64_t blob_size = 0;

    bool is_space_root() const { return parent_id.empty(); }
};

struct NodeInfo {
    std::string name;
    bool is_directory = false;
    std::int64_t size = 0;
    std::int64_t mtime = 0;
};

// Second phase of a two-phase tree operation. The caller does its own bookkeeping
// between prepare and apply(); apply() may run once.
class PendingCommit {
public:
    PendingCommit() = default;
    explicit PendingCommit(std::function<void()> action);

    PendingCommit(const PendingCommit&) = delete;
    PendingCommit& operator=(const PendingCommit&) = delete;
    PendingCommit(PendingCommit&&) = default;
    PendingCommit& operator=(PendingCommit&&) = default;

    void apply();
    bool applied() const { return applied_; }

private:
    std::function<void()> action_;
    bool applied_ = false;
};

struct RestorePlan {
    Node restored;
    Node parent;
    PendingCommit commit;
};

struct PurgePlan {
    Node purged;
    PendingCommit commit;
};

// Storage backend contract consumed by the upload engine.
class Tree {
public:
    virtual ~Tree() = default;

    virtual NodeInfo get_md(const Node& node) = 0;
    virtual std::vector<Node> list_folder(const Node& node) = 0;
    virtual void create_dir(const Node& node) = 0;
    virtual void move(const Node& old_node, const Node& new_node) = 0;
    virtual void remove(const Node& node) = 0;

    // `target` overrides the original location when its parent id is set.
    virtual RestorePlan restore_recycle_item(const std::string& space_id, const std::string& key,
                                             const Node* target) = 0;
    virtual PurgePlan purge_recycle_item(const std::string& space_id, const std::string& key) = 0;

    virtual void write_blob(const Node& node, const std::filesystem::path& bin_path) = 0;
    virtual std::unique_ptr<std::istream> read_blob(const Node& node) = 0;
    virtual void delete_blob(const Node& node) = 0;

    virtual void propagate(const Node& node, std::int64_t size_diff) = 0;

    virtual Node read_node(const std::string& space_id, const std::string& node_id) = 0;
    virtual Attributes attributes(const Node& node) = 0;

    // Materializes (or overwrites) the node targeted by the session and stores `checksums` on it.
    // Fills in session.node_id, versions_path and size_diff.
    virtual Node create_node_for_upload(UploadSession& session, const Attributes& checksums) = 0;
    // Removes the node's storage entry and its link in the parent directory.
    virtual void remove_node(const Node& node) = 0;
    virtual void restore_version(const std::string& versions_path, const Node& node,
                                 const AttributeFilter& filter) = 0;
    virtual void remove_version(const std::string& versions_path) = 0;
    virtual void unmark_processing(const Node& node, const std::string& upload_id) = 0;
};

}  // namespace vault::server
