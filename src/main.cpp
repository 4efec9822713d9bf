#include "config.hpp"
#include "event_bus.hpp"
#include "event.hpp"
#include "gateway.hpp"
#include "http.hpp"
#include "ingest.hpp"
#include "index/note_json.hpp"
#include "plugin.hpp"
#include "query.hpp"
#include "task_group.hpp"
#include "util.hpp"
#include "vector_index.hpp"
#include <chrono>
#include <csignal>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

static const papernotes::CancelToken* g_cancel = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_cancel) g_cancel->cancel();
}

static void print_usage() {
    std::cout << "Usage: papernotes COMMAND [options]\n"
              << "\n"
              << "Commands:\n"
              << "  ingest IMAGE         Scan a note image and store it\n"
              << "      --id N             Re-scan into existing note N\n"
              << "      --collection NAME  Put the note in a collection\n"
              << "  search IMAGE         Find notes matching an image\n"
              << "  similar IMAGE --collection NAME\n"
              << "                       Closest note in a collection by visual features\n"
              << "  get ID               Print a stored note\n"
              << "  status               Show model and index status\n"
              << "\n"
              << "Options:\n"
              << "  --timeout SECONDS    Cancel the run after this many seconds\n"
              << "  -v, --verbose        Print every pipeline event\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  PAPERNOTES_GATEWAY_URL      Model server base URL (default: http://localhost:8900)\n"
              << "  PAPERNOTES_GATEWAY_API_KEY  Bearer token for the model server\n"
              << "  PAPERNOTES_INDEX_BACKEND    Index backend (sqlite, json)\n"
              << "  PAPERNOTES_INDEX_PATH       Index file location\n";
}

static std::string fmt_distance(const std::optional<double>& d) {
    if (!d) return "-";
    std::ostringstream os;
    os << std::fixed << std::setprecision(4) << *d;
    return os.str();
}

static void print_result(size_t rank, const papernotes::SearchResult& r) {
    using papernotes::EmbeddingField;
    using papernotes::field_index;
    std::cout << rank << ". #" << r.note.id << " " << r.note.title
              << "  score=" << fmt_distance(r.score.score) << "\n";
    for (auto f : papernotes::kFusedFields) {
        size_t i = field_index(f);
        if (!r.score.observed[i]) continue;
        std::cout << "     " << std::left << std::setw(12) << papernotes::field_to_string(f)
                  << std::right << fmt_distance(r.score.observed[i])
                  << (r.score.evidence[i] ? "" : "  (above threshold)") << "\n";
    }
    std::string ocr = papernotes::combined_ocr_text(r.note);
    if (!ocr.empty()) {
        std::cout << "     " << papernotes::preview(ocr) << "\n";
    }
}

static int cmd_ingest(papernotes::IngestionPipeline& pipeline, const std::string& image,
                      const papernotes::IngestOptions& options,
                      const papernotes::CancelToken& cancel) {
    auto result = pipeline.ingest(image, options, cancel);
    if (!result.success) {
        std::cerr << "Error (" << papernotes::ingest_error_to_string(result.error) << "): "
                  << result.message << "\n";
        return 1;
    }
    const auto& note = result.note;
    std::cout << (result.reingested ? "Updated" : "Saved") << " note #" << note.id
              << " \"" << note.title << "\"";
    if (note.collection) std::cout << " in " << *note.collection;
    std::cout << "\n";
    for (const auto& a : result.annotations) {
        std::cout << "  " << a << "\n";
    }
    for (auto f : papernotes::kAllFields) {
        std::cout << "  " << std::left << std::setw(12) << papernotes::field_to_string(f)
                  << std::right << (note.vector(f) ? "ok" : "missing") << "\n";
    }
    return 0;
}

static int cmd_search(papernotes::QueryPipeline& pipeline, const std::string& image,
                      const papernotes::CancelToken& cancel) {
    auto results = pipeline.search(image, cancel);
    if (cancel.cancelled()) {
        std::cerr << "Search cancelled.\n";
        return 1;
    }
    if (results.empty()) {
        std::cout << "No matching notes.\n";
        return 0;
    }
    for (size_t i = 0; i < results.size(); i++) {
        print_result(i + 1, results[i]);
    }
    return 0;
}

static int cmd_similar(papernotes::QueryPipeline& pipeline, const std::string& image,
                       const std::string& collection, const papernotes::CancelToken& cancel) {
    auto result = pipeline.find_similar_in_collection(image, collection, cancel);
    if (!result) {
        std::cout << "No similar note in " << collection << ".\n";
        return 0;
    }
    std::cout << "#" << result->note.id << " " << result->note.title
              << "  distance=" << fmt_distance(result->score.score) << "\n";
    return 0;
}

static int cmd_get(papernotes::VectorIndex& index, const std::string& id_arg) {
    papernotes::NoteId id = 0;
    try {
        id = std::stoull(id_arg);
    } catch (const std::exception&) {
        std::cerr << "Error: invalid note id: " << id_arg << "\n";
        return 1;
    }
    auto note = index.get(id);
    if (!note) {
        std::cerr << "Error: note " << id << " not found\n";
        return 1;
    }
    auto j = papernotes::note_to_json(*note, /*include_vectors=*/false);
    j["combined_ocr_text"] = papernotes::combined_ocr_text(*note);
    std::cout << j.dump(2) << "\n";
    return 0;
}

static int cmd_status(papernotes::EmbeddingGateway& gateway, papernotes::VectorIndex& index) {
    const auto& registry = papernotes::PluginRegistry::instance();
    std::cout << "Gateway: " << gateway.gateway_name() << " (available: "
              << papernotes::join(registry.gateway_names(), ", ") << ")\n";
    bool all_ready = true;
    for (const auto& s : gateway.status()) {
        std::cout << "  " << std::left << std::setw(24) << s.name << std::right
                  << (s.ready ? "ready" : "not ready") << "\n";
        all_ready = all_ready && s.ready;
    }
    std::cout << "Index: " << index.backend_name() << ", " << index.count() << " notes (available: "
              << papernotes::join(registry.index_names(), ", ") << ")\n";
    for (auto f : papernotes::kAllFields) {
        std::cout << "  " << std::left << std::setw(24) << papernotes::field_to_string(f)
                  << std::right << index.count_with(f) << "\n";
    }
    return all_ready ? 0 : 1;
}

int main(int argc, char* argv[]) try {
    std::string command;
    std::string target;
    std::string collection;
    papernotes::NoteId existing_id = 0;
    long timeout_seconds = 0;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--id") == 0 && i + 1 < argc) {
            existing_id = std::stoull(argv[++i]);
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout_seconds = std::stol(argv[++i]);
        } else if (std::strcmp(argv[i], "--collection") == 0 && i + 1 < argc) {
            collection = argv[++i];
        } else if (argv[i][0] != '-' && command.empty()) {
            command = argv[i];
        } else if (argv[i][0] != '-' && target.empty()) {
            target = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    bool needs_target = command == "ingest" || command == "search" ||
                        command == "similar" || command == "get";
    if (command.empty() || (needs_target && target.empty()) ||
        (command == "similar" && collection.empty())) {
        print_usage();
        return 1;
    }

    // Initialize
    papernotes::http_init();
    auto config = papernotes::Config::load();

    papernotes::CurlHttpClient http_client;
    auto index = papernotes::create_vector_index(config);
    auto gateway = papernotes::create_gateway(config, http_client);
    papernotes::WorkerPool pool(config.workers);

    papernotes::EventBus bus;
    papernotes::subscribe<papernotes::PipelineProgressEvent>(bus,
        [](const papernotes::PipelineProgressEvent& ev) {
            if (ev.message.empty()) return;
            std::cerr << "[" << std::setw(3) << static_cast<int>(ev.fraction * 100) << "%] "
                      << ev.message << "\n";
        });
    if (verbose) {
        bus.subscribe_all([](const papernotes::Event& ev) {
            std::cerr << "[event] " << ev.type_tag << "\n";
        });
    }

    // A deadline covers the whole run; Ctrl-C cancels it early
    papernotes::CancelToken cancel = timeout_seconds > 0
        ? papernotes::CancelToken::with_deadline(std::chrono::seconds(timeout_seconds))
        : papernotes::CancelToken();
    g_cancel = &cancel;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int rc = 1;
    if (command == "ingest") {
        papernotes::IngestionPipeline pipeline(*gateway, *index, pool, config, &bus);
        papernotes::IngestOptions options;
        options.existing_id = existing_id;
        if (!collection.empty()) options.collection = collection;
        rc = cmd_ingest(pipeline, target, options, cancel);
    } else if (command == "search") {
        papernotes::QueryPipeline pipeline(*gateway, *index, pool, config, &bus);
        rc = cmd_search(pipeline, target, cancel);
    } else if (command == "similar") {
        papernotes::QueryPipeline pipeline(*gateway, *index, pool, config, &bus);
        rc = cmd_similar(pipeline, target, collection, cancel);
    } else if (command == "get") {
        rc = cmd_get(*index, target);
    } else if (command == "status") {
        rc = cmd_status(*gateway, *index);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
    }

    g_cancel = nullptr;
    papernotes::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
