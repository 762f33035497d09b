#include "../include/analysis_cache.hpp"
#include "../include/cached_runner.hpp"
#include "../include/confirm_gate.hpp"
#include "../include/document_store.hpp"
#include "../include/errors.hpp"
#include "../include/ingestion.hpp"
#include "../include/interaction_log.hpp"
#include "../include/maintenance.hpp"
#include "../include/search_log.hpp"
#include "../include/telemetry_log.hpp"
#include "../include/util.hpp"
#include "../../../shared/cpp/llm_sdk/include/llm_client.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <map>
#include <random>

using json = nlohmann::json;

namespace {
std::string gen_session_token() {
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<uint64_t> dist;
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)dist(rng));
    return std::string(buf, 12);
}

std::chrono::seconds days(int n) { return std::chrono::hours(24 * n); }

const std::map<std::string, std::string> kAnalysisPrompts = {
    {"global", "Give a concise global market overview (size, growth, CAGR, key regions) of"},
    {"vertical", "List the vertical submarkets as a markdown table for"},
    {"horizontal", "List the horizontal submarkets as a markdown table for"},
    {"metrics", "Summarize the key market metrics for"},
    {"top_companies", "List the top companies with market share for"},
    {"mergers", "Produce a markdown table of recent mergers and acquisitions in"},
    {"web_insights", "Summarize recent public insights and news about"}
};

// <handle>:<start>-<end>
ChunkRange parse_chunk(const std::string& s) {
    auto colon = s.rfind(':');
    auto dash = s.find('-', colon == std::string::npos ? 0 : colon);
    if (colon == std::string::npos || dash == std::string::npos) {
        throw MalformedInputError("chunk must look like <handle>:<start>-<end>, got " + s);
    }
    ChunkRange c;
    c.handle = s.substr(0, colon);
    try {
        c.start_page = std::stoi(s.substr(colon + 1, dash - colon - 1));
        c.end_page = std::stoi(s.substr(dash + 1));
    } catch (const std::exception&) {
        throw MalformedInputError("bad page range in chunk " + s);
    }
    return c;
}

void print_record(const DocumentRecord& d) {
    std::cout << "#" << d.id << " " << d.display_name << " pages=" << d.page_count
              << " chunks=" << d.chunk_count << " processed=" << format_timestamp(d.processed_at)
              << " status=" << d.status << "\n";
}

void print_chunks(const std::vector<ChunkRange>& chunks) {
    for (const auto& c : chunks) {
        std::cout << "  " << c.handle << " pages " << c.start_page << "-" << c.end_page << "\n";
    }
}

void usage() {
    std::cerr << "store_cli usage (global: --db <dbfile>):\n"
              << "  init\n"
              << "  analyze --subject S --kind K [--param k=v]... [--ttl-hours N] [--single-flight]\n"
              << "          [--ollama <url>] [--llm <name>]\n"
              << "  browse [--limit N]                      cached analyses, newest first\n"
              << "  popular [--days N] [--limit N]\n"
              << "  delete-subject --subject S [--kind K]\n"
              << "  ingest --file <path> --chunk <handle>:<start>-<end> [--chunk ...]\n"
              << "  sessions [--limit N]\n"
              << "  restore --doc ID\n"
              << "  ask --doc ID --question \"...\" [--ollama <url>] [--llm <name>]\n"
              << "  history --doc ID [--oldest-first]\n"
              << "  delete-qa --doc ID [--question \"...\"]  all Q&A when --question is absent\n"
              << "  delete-doc --doc ID\n"
              << "  log-search --subject S --timeframe T [--payload-file <path>] [--deals N]\n"
              << "  searches [--limit N] [--subject S]\n"
              << "  purge-searches --days N\n"
              << "  analytics [--days N]\n"
              << "  stats | sweep | compact | cleanup [--retention-days N]\n"
              << "  backup --out <path>\n"
              << "  wipe --scope cache|documents|searches|telemetry|everything\n";
}
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];

    StoreConfig cfg;
    cfg.db_path = getenv_or("STORE_DB_PATH", "./data/market_intel.db");
    LlmConfig llm;
    llm.ollama_url = getenv_or("OLLAMA_URL", llm.ollama_url);
    llm.llm_model = getenv_or("STORE_LLM_MODEL", llm.llm_model);

    std::map<std::string, std::string> opt;
    std::vector<std::string> params;
    std::vector<std::string> chunk_specs;
    bool single_flight = false;
    bool oldest_first = false;
    try {
        cfg.busy_timeout_ms = getenv_int_or("STORE_BUSY_TIMEOUT_MS", cfg.busy_timeout_ms);
        int ttl_hours = getenv_int_or("STORE_CACHE_TTL_HOURS", 24);

        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--single-flight") single_flight = true;
            else if (a == "--oldest-first") oldest_first = true;
            else if (a == "--param" && i + 1 < argc) params.push_back(argv[++i]);
            else if (a == "--chunk" && i + 1 < argc) chunk_specs.push_back(argv[++i]);
            else if (a.rfind("--", 0) == 0 && i + 1 < argc) opt[a.substr(2)] = argv[++i];
            else { usage(); return 2; }
        }
        auto get = [&](const std::string& k, const std::string& def = {}) {
            auto it = opt.find(k);
            return it == opt.end() ? def : it->second;
        };
        auto get_int = [&](const std::string& k, int def) {
            auto it = opt.find(k);
            return it == opt.end() ? def : std::stoi(it->second);
        };
        auto require = [&](const std::string& k) {
            auto it = opt.find(k);
            if (it == opt.end() || it->second.empty()) throw MalformedInputError("--" + k + " is required");
            return it->second;
        };

        cfg.db_path = get("db", cfg.db_path);
        llm.ollama_url = get("ollama", llm.ollama_url);
        llm.llm_model = get("llm", llm.llm_model);
        ttl_hours = get_int("ttl-hours", ttl_hours);

        Database db(cfg);
        const std::string session = gen_session_token();

        if (cmd == "init") {
            std::cout << "[OK] Store initialized at: " << db.path() << "\n";
        } else if (cmd == "analyze") {
            const std::string subject = require("subject");
            const std::string kind = require("kind");
            json p = json::object();
            for (const auto& kv : params) {
                auto eq = kv.find('=');
                if (eq == std::string::npos) throw MalformedInputError("--param must be key=value, got " + kv);
                p[kv.substr(0, eq)] = kv.substr(eq + 1);
            }
            auto prompt = kAnalysisPrompts.find(kind);
            if (prompt == kAnalysisPrompts.end()) throw MalformedInputError("unknown analysis kind: " + kind);

            OllamaTextService service(llm);
            CachedRunner runner(db);
            RunOptions ro;
            ro.source = "ollama:" + llm.llm_model;
            ro.ttl = std::chrono::hours(ttl_hours);
            ro.single_flight = single_flight;
            ro.session_token = session;
            auto res = runner.run(subject, kind, p, [&]() {
                std::string user = prompt->second + " " + subject + ".";
                if (!p.empty()) user += "\nConstraints: " + p.dump();
                return service.generate("You are a market research analyst. Answer in markdown.", user);
            }, ro);
            std::cout << (res.cache_hit ? "[store] cache hit\n" : "[store] computed fresh\n");
            std::cout << "\n" << res.payload << "\n";
        } else if (cmd == "browse") {
            for (const auto& r : AnalysisCache(db).history(get_int("limit", 20))) {
                std::cout << format_timestamp(r.created_at) << "  " << r.subject << " / " << r.query_kind
                          << " (" << r.access_count << ")\n";
            }
        } else if (cmd == "popular") {
            for (const auto& r : AnalysisCache(db).popular(days(get_int("days", 30)), get_int("limit", 10))) {
                std::cout << r.subject << "  queries=" << r.count
                          << "  last=" << format_timestamp(r.last_access) << "\n";
            }
        } else if (cmd == "delete-subject") {
            AnalysisCache cache(db);
            const std::string subject = require("subject");
            int64_t n = opt.count("kind") ? cache.remove_entry(subject, get("kind")) : cache.remove_subject(subject);
            std::cout << "[OK] Deleted " << n << " analyses for " << subject << "\n";
        } else if (cmd == "ingest") {
            const std::string path = require("file");
            if (chunk_specs.empty()) throw MalformedInputError("at least one --chunk is required");
            DocumentStore documents(db);
            TelemetryLog telemetry(db);
            auto res = ingest_document(documents, telemetry, std::filesystem::path(path).filename().string(),
                                       read_file_bytes(path),
                                       [&](const std::string&) {
                                           std::vector<ChunkRange> out;
                                           for (const auto& s : chunk_specs) out.push_back(parse_chunk(s));
                                           return out;
                                       },
                                       session);
            std::cout << (res.reused ? "[OK] Already processed, reusing document #" : "[OK] Recorded document #")
                      << res.document_id << " with " << res.chunks.size() << " chunks\n";
            print_chunks(res.chunks);
        } else if (cmd == "sessions") {
            for (const auto& s : DocumentStore(db).sessions(get_int("limit", 15))) {
                print_record(s.record);
                std::cout << "  questions=" << s.interaction_count;
                if (s.last_question_at) std::cout << " last=" << format_timestamp(*s.last_question_at);
                std::cout << "\n";
            }
        } else if (cmd == "restore") {
            auto s = DocumentStore(db).restore(std::stoll(require("doc")));
            if (!s) {
                std::cout << "[store] no processed document with that id\n";
                return 1;
            }
            print_record(s->record);
            print_chunks(s->chunks);
            for (const auto& q : s->interactions) {
                std::cout << "[" << format_timestamp(q.created_at) << "] Q: " << q.question << "\nA: " << q.answer << "\n";
            }
        } else if (cmd == "ask") {
            const int64_t doc_id = std::stoll(require("doc"));
            const std::string question = require("question");
            auto doc = DocumentStore(db).get(doc_id);
            if (!doc) throw NotFoundError("document " + std::to_string(doc_id) + " does not exist");

            OllamaTextService service(llm);
            std::string handles;
            for (const auto& h : doc->chunk_handles) handles += (handles.empty() ? "" : ", ") + h;
            std::string answer = service.generate(
                "You answer questions about the document " + doc->display_name +
                    " (chunk files: " + handles + "). If unsure, say you don't know.",
                question);
            InteractionLog log(db);
            int64_t qtok = estimate_tokens(question);
            int64_t rtok = estimate_tokens(answer);
            int64_t id = log.append(doc_id, question, answer, qtok, rtok);
            TelemetryLog(db).log_event("pdf_query", json{{"document_id", doc_id}, {"question_length", question.size()}}, session);
            std::cout << "\n==== Answer ====\n\n" << answer << "\n\n[OK] Saved interaction #" << id << "\n";
        } else if (cmd == "history") {
            auto order = oldest_first ? HistoryOrder::OldestFirst : HistoryOrder::NewestFirst;
            for (const auto& q : InteractionLog(db).history(std::stoll(require("doc")), order)) {
                std::cout << "[" << format_timestamp(q.created_at) << "] cost=$" << q.cost_estimate
                          << "\n  Q: " << q.question << "\n  A: " << q.answer << "\n";
            }
        } else if (cmd == "delete-qa") {
            InteractionLog log(db);
            const int64_t doc_id = std::stoll(require("doc"));
            int64_t n = opt.count("question") ? log.delete_one(doc_id, get("question")) : log.delete_all(doc_id);
            std::cout << "[OK] Deleted " << n << " Q&A entries\n";
        } else if (cmd == "delete-doc") {
            int64_t n = DocumentStore(db).remove(std::stoll(require("doc")));
            std::cout << "[OK] Deleted document and " << n << " Q&A entries\n";
        } else if (cmd == "log-search") {
            const std::string subject = require("subject");
            std::string payload = opt.count("payload-file") ? read_file_bytes(get("payload-file")) : std::string();
            int64_t deals = get_int("deals", 0);
            int64_t id = SearchLog(db).append(subject, require("timeframe"), payload, deals);
            TelemetryLog(db).log_event("ma_search", json{{"market_name", subject}, {"deals_found", deals}}, session);
            std::cout << "[OK] Saved search #" << id << "\n";
        } else if (cmd == "searches") {
            SearchLog log(db);
            int limit = get_int("limit", 10);
            auto rows = opt.count("subject") ? log.by_subject(get("subject"), limit) : log.recent(limit);
            for (const auto& r : rows) {
                std::cout << "#" << r.id << " " << format_timestamp(r.created_at) << "  " << r.subject
                          << " [" << r.timeframe << "] deals=" << r.deals_found << "\n";
            }
        } else if (cmd == "purge-searches") {
            int64_t n = SearchLog(db).purge_older_than(days(std::stoi(require("days"))));
            std::cout << "[OK] Deleted " << n << " old M&A searches\n";
        } else if (cmd == "analytics") {
            TelemetryLog telemetry(db);
            int window = get_int("days", 30);
            std::cout << "Events in the last " << window << " days: " << telemetry.count_since(days(window)) << "\n";
            for (const auto& d : telemetry.daily_counts(days(window), 10)) {
                std::cout << "  " << d.date << "  " << d.count << "\n";
            }
            std::cout << "By kind (last 7 days):\n";
            for (const auto& k : telemetry.kind_counts(days(7))) {
                std::cout << "  " << k.kind << "  " << k.count << "\n";
            }
        } else if (cmd == "stats") {
            auto s = Maintenance(db).stats();
            std::cout << "cache_entries     " << s.cache_entries << "\n"
                      << "documents         " << s.documents << "\n"
                      << "interactions      " << s.interactions << "\n"
                      << "searches          " << s.searches << "\n"
                      << "telemetry_events  " << s.telemetry_events << "\n"
                      << "store_bytes       " << s.store_bytes << "\n";
        } else if (cmd == "sweep") {
            std::cout << "[OK] Removed " << AnalysisCache(db).sweep_expired() << " expired cache entries\n";
        } else if (cmd == "compact") {
            Maintenance(db).compact();
            std::cout << "[OK] Compacted " << db.path() << "\n";
        } else if (cmd == "cleanup") {
            auto r = Maintenance(db).full_cleanup(days(get_int("retention-days", 90)));
            std::cout << "[OK] Cleanup complete: " << r.expired_cache_removed << " expired cache entries, "
                      << r.telemetry_removed << " old analytics entries\n";
        } else if (cmd == "backup") {
            const std::string out = require("out");
            Maintenance(db).backup(out);
            std::cout << "[OK] Backed up to " << out << "\n";
        } else if (cmd == "wipe") {
            const BulkScope scope = parse_scope(require("scope"));
            ConfirmGate gate;
            gate.arm(to_string(scope));
            std::cout << "[store] This permanently deletes " << to_string(scope)
                      << ". Type the scope name again to confirm: " << std::flush;
            std::string answer;
            std::getline(std::cin, answer);
            if (!gate.commit(answer)) {
                std::cout << "[store] Not confirmed, nothing deleted\n";
                return 1;
            }
            int64_t n = Maintenance(db).bulk_delete(scope);
            std::cout << "[OK] Deleted " << n << " rows (" << to_string(scope) << ")\n";
        } else {
            usage();
            return 1;
        }
        return 0;
    } catch (const StoreError& e) {
        std::cerr << "[ERROR] " << to_string(e.kind()) << ": " << e.what() << "\n";
        return e.kind() == ErrorKind::StorageUnavailable ? 3 : 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
