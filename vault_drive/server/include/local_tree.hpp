#pragma once

#include "tree.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

struct sqlite3;

namespace vault::server {

class Logger;

struct RecycleEntry {
    std::string key;
    std::string node_id;
    std::string name;
    std::int64_t deleted_at = 0;
};

// Tree backend keeping node metadata in sqlite and blobs as plain files under `<root>/blobs`.
class LocalTree : public Tree {
public:
    LocalTree(std::filesystem::path root, const std::string& database_path, Logger& logger);
    ~LocalTree() override;

    LocalTree(const LocalTree&) = delete;
    LocalTree& operator=(const LocalTree&) = delete;

    void initialize_schema();

    Node create_space(const std::string& space_id, const std::string& owner);
    void set_attribute(const Node& node, const std::string& name, const std::string& value);
    std::optional<Node> find_child(const std::string& space_id, const std::string& parent_id,
                                   const std::string& name);
    bool version_exists(const std::string& versions_path);
    std::filesystem::path blob_path(const Node& node) const;
    std::vector<RecycleEntry> list_recycle(const std::string& space_id);

    NodeInfo get_md(const Node& node) override;
    std::vector<Node> list_folder(const Node& node) override;
    void create_dir(const Node& node) override;
    void move(const Node& old_node, const Node& new_node) override;
    void remove(const Node& node) override;
    RestorePlan restore_recycle_item(const std::string& space_id, const std::string& key,
                                     const Node* target) override;
    PurgePlan purge_recycle_item(const std::string& space_id, const std::string& key) override;

    void write_blob(const Node& node, const std::filesystem::path& bin_path) override;
    std::unique_ptr<std::istream> read_blob(const Node& node) override;
    void delete_blob(const Node& node) override;

    void propagate(const Node& node, std::int64_t size_diff) override;

    Node read_node(const std::string& space_id, const std::string& node_id) override;
    Attributes attributes(const Node& node) override;

    Node create_node_for_upload(UploadSession& session, const Attributes& checksums) override;
    void remove_node(const Node& node) override;
    void restore_version(const std::string& versions_path, const Node& node,
                         const AttributeFilter& filter) override;
    void remove_version(const std::string& versions_path) override;
    void unmark_processing(const Node& node, const std::string& upload_id) override;

private:
    struct RecycleItem {
        std::string node_id;
        std::string parent_id;
        std::string name;
    };

    // Helpers below expect mutex_ to be held.
    void exec(const char* sql);
    Attributes load_attributes(const std::string& space_id, const std::string& node_id);
    void store_attribute(const std::string& space_id, const std::string& node_id, const std::string& name,
                         const std::string& value);
    void erase_attribute(const std::string& space_id, const std::string& node_id, const std::string& name);
    bool erase_attributes(const std::string& space_id, const std::string& node_id);
    std::optional<std::string> lookup_link(const std::string& space_id, const std::string& parent_id,
                                           const std::string& name);
    void insert_link(const std::string& space_id, const std::string& parent_id, const std::string& name,
                     const std::string& node_id);
    bool erase_link(const std::string& space_id, const std::string& parent_id, const std::string& name);
    std::vector<std::string> child_ids(const std::string& space_id, const std::string& parent_id);
    std::optional<RecycleItem> load_recycle_item(const std::string& space_id, const std::string& key);
    Node node_locked(const std::string& space_id, const std::string& node_id);
    std::int64_t node_size(const Node& node, const Attributes& attributes) const;
    void propagate_from(const std::string& space_id, const std::string& start_id, std::int64_t size_diff);
    void require_directory(const std::string& space_id, const std::string& node_id);

    std::filesystem::path root_;
    std::filesystem::path blobs_dir_;
    Logger& logger_;
    std::mutex mutex_;
    sqlite3* db_{};
};

}  // namespace vault::server
