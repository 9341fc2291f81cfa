#include "config_loader.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "ids.hpp"
#include "local_tree.hpp"
#include "logger.hpp"
#include "postprocessing_driver.hpp"
#include "token_issuer.hpp"
#include "tracer.hpp"
#include "upload_engine.hpp"
#include "upload_session.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace vault::server;

void print_usage() {
    std::cerr << "usage: vault_upload <config> <command> [args]\n"
              << "  put <file> <space> <parent> <name> [chunk] [--sha1 X|--md5 X|--adler32 X]\n"
              << "  resume <upload-id> <file>\n"
              << "  info <upload-id>\n"
              << "  terminate <upload-id>\n"
              << "  mkspace <space> [owner]\n"
              << "  mkdir <space> <parent> <name>\n"
              << "  drain\n";
}

// Serves at most `limit` bytes of the underlying stream, one request body at a time.
class SliceSource : public ByteSource {
public:
    SliceSource(std::istream& stream, std::uint64_t limit) : stream_(stream), remaining_(limit) {}

    std::size_t read(char* buffer, std::size_t size) override {
        if (remaining_ == 0) {
            return 0;
        }
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(size, remaining_));
        stream_.read(buffer, static_cast<std::streamsize>(want));
        if (stream_.bad()) {
            throw std::runtime_error("read error on local file");
        }
        const auto got = static_cast<std::size_t>(stream_.gcount());
        remaining_ -= got;
        return got;
    }

private:
    std::istream& stream_;
    std::uint64_t remaining_;
};

void stream_file(Upload& upload, const std::filesystem::path& file, std::uint64_t chunk_bytes) {
    std::ifstream input(file, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open " + file.string());
    }
    input.seekg(upload.session().offset);
    while (upload.session().offset < upload.session().size) {
        SliceSource chunk(input, chunk_bytes);
        const auto written = upload.write_chunk(upload.session().offset, chunk);
        std::cout << "offset " << upload.session().offset << "/" << upload.session().size << std::endl;
        if (written == 0) {
            throw std::runtime_error(file.string() + " is shorter than the declared upload size");
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage();
        return 2;
    }
    const std::string config_path = argv[1];
    const std::string command = argv[2];
    const std::vector<std::string> args(argv + 3, argv + argc);

    try {
        auto config = load_config(config_path);
        Logger logger(config.log_file, parse_log_level(config.log_level));
        LogTracer tracer(logger, "upload");

        LocalTree tree(config.storage_root, config.database_file, logger);
        tree.initialize_schema();
        SessionStore sessions(config.database_file, std::filesystem::path(config.storage_root) / "uploads");
        sessions.initialize_schema();

        TokenIssuer tokens(config.tokens);
        LocalEventBus bus;

        UploadEngine engine(tree, sessions, logger, tracer, tokens, &bus,
                            {.async = config.async_postprocessing,
                             .copy_buffer_bytes = config.max_chunk_bytes,
                             .propagation_retries = config.propagation_retries});
        PostprocessingDriver driver(engine, logger, config.postprocessing_threads);
        if (config.async_postprocessing) {
            driver.attach(bus);
        }

        if (command == "put" && args.size() >= 4) {
            const std::filesystem::path file = args[0];
            NewUploadRequest request;
            request.space_root = args[1];
            request.parent_id = args[2];
            request.filename = args[3];
            request.size = static_cast<std::int64_t>(std::filesystem::file_size(file));
            std::uint64_t chunk = config.max_chunk_bytes;
            for (std::size_t i = 4; i < args.size(); ++i) {
                if (args[i] == "--sha1" && i + 1 < args.size()) {
                    request.checksum_sha1 = args[++i];
                } else if (args[i] == "--md5" && i + 1 < args.size()) {
                    request.checksum_md5 = args[++i];
                } else if (args[i] == "--adler32" && i + 1 < args.size()) {
                    request.checksum_adler32 = args[++i];
                } else {
                    chunk = std::stoull(args[i]);
                }
            }
            auto upload = engine.new_upload(request);
            std::cout << "upload " << upload->session().id << std::endl;
            stream_file(*upload, file, std::max<std::uint64_t>(chunk, 1));
            upload->finish_upload();
            std::cout << "committed node " << upload->session().node_id << std::endl;
        } else if (command == "resume" && args.size() == 2) {
            auto upload = engine.get_upload(args[0]);
            stream_file(*upload, args[1], config.max_chunk_bytes);
            upload->finish_upload();
            std::cout << "committed node " << upload->session().node_id << std::endl;
        } else if (command == "info" && args.size() == 1) {
            const auto info = engine.get_upload(args[0])->get_info();
            std::cout << "id=" << info.id << "\noffset=" << info.offset << "\nsize=" << info.size
                      << "\nsize_is_deferred=" << (info.size_is_deferred ? "true" : "false") << "\n";
            for (const auto& [key, value] : info.metadata) {
                std::cout << key << "=" << value << "\n";
            }
        } else if (command == "terminate" && args.size() == 1) {
            engine.terminate(args[0]);
        } else if (command == "mkspace" && !args.empty()) {
            const auto root = tree.create_space(args[0], args.size() > 1 ? args[1] : args[0]);
            std::cout << "space " << root.id << std::endl;
        } else if (command == "mkdir" && args.size() == 3) {
            Node dir;
            dir.space_id = args[0];
            dir.parent_id = args[1];
            dir.name = args[2];
            dir.id = vault::util::random_id();
            dir.type = NodeType::kDirectory;
            tree.create_dir(dir);
            std::cout << "dir " << dir.id << std::endl;
        } else if (command == "drain") {
            std::cout << "scheduled " << driver.resume_pending() << " pending uploads" << std::endl;
        } else {
            print_usage();
            return 2;
        }

        driver.wait_idle();
    } catch (const UploadError& ex) {
        std::cerr << "Upload error [" << error_code_name(ex.code()) << "]: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
