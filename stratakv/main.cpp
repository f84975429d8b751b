#include "strata/core/logging.hpp"
#include "strata/storage/file_store.hpp"
#include "strata/model.hpp"
#include "strata/store.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cctype>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace {
	using backing_type = strata::storage::file_store;
	using model_type = strata::default_model<std::string, std::string>;
	using store_type = strata::store<model_type, backing_type>;

	struct options {
		std::string directory;
		strata::settings cfg{};
		std::string log_level = "warn";
		std::int64_t capacity_wait_ms = strata::settings{}.capacity_wait.count();
		std::int64_t io_backoff_us = strata::settings{}.io_retry.initial_backoff.count();

		strata::settings store_settings() const {
			auto out = cfg;
			out.capacity_wait = std::chrono::milliseconds(capacity_wait_ms);
			out.io_retry.initial_backoff = std::chrono::microseconds(io_backoff_us);
			return out;
		}
	};

	std::string fence_str(const std::optional<std::string>& fence) {
		return fence ? "\"" + *fence + "\"" : std::string("-");
	}

	std::vector<std::string> split_command(const std::string& line) {
		std::vector<std::string> args;
		std::string current;
		bool in_quotes = false;
		bool escaped = false;

		for (char ch : line) {
			if (escaped) {
				current += ch;
				escaped = false;
			}
			else if (ch == '\\') {
				escaped = true;
			}
			else if (ch == '"') {
				in_quotes = !in_quotes;
			}
			else if (std::isspace(static_cast<unsigned char>(ch)) && !in_quotes) {
				if (!current.empty()) {
					args.push_back(current);
					current.clear();
				}
			}
			else {
				current += ch;
			}
		}

		if (!current.empty()) {
			args.push_back(current);
		}

		return args;
	}

	int cmd_put(store_type& db, const std::string& key, const std::string& value) {
		try {
			auto old = db.get_put(key, value);
			std::cout << (old ? "updated " : "inserted ") << key << "\n";
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error writing key: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_get(store_type& db, const std::string& key) {
		try {
			auto value = db.get(key);
			if (!value) {
				std::cerr << "Key not found: " << key << "\n";
				return 1;
			}
			std::cout << *value << "\n";
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error reading key: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_rm(store_type& db, const std::string& key) {
		try {
			if (!db.take(key)) {
				std::cerr << "Key not found: " << key << "\n";
				return 1;
			}
			std::cout << "removed " << key << "\n";
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error removing key: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_scan(store_type& db, const std::optional<std::string>& from, std::size_t limit) {
		try {
			auto range = from ? db.scan(*from) : db.scan();
			std::size_t shown = 0;
			for (const auto& [key, value] : range) {
				if (shown >= limit) {
					break;
				}
				std::cout << key << " = " << value << "\n";
				++shown;
			}
			std::cout << "(" << shown << " entries)\n";
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error scanning: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_pages(store_type& db) {
		try {
			auto pg = db.head_page();
			for (;;) {
				std::cout << "page " << pg.id()
					<< " first=" << fence_str(pg.first_key())
					<< " next=" << fence_str(pg.get_next_first_key())
					<< " entries=" << pg.size()
					<< " gen=" << pg.generation() << "\n";
				if (pg.is_last()) {
					break;
				}
				pg = db.page_at(*pg.get_next_first_key());
			}
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error listing pages: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_verify(store_type& db) {
		try {
			auto report = db.verify();
			std::cout << "pages:   " << report.pages << "\n";
			std::cout << "entries: " << report.entries << "\n";
			for (const auto& p : report.problems) {
				std::cout << "problem: " << p << "\n";
			}
			std::cout << (report.ok() ? "OK" : "FAILED") << "\n";
			return report.ok() ? 0 : 2;
		}
		catch (const std::exception& e) {
			std::cerr << "Error verifying: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_stat(store_type& db) {
		const auto st = db.stats();
		const auto& cfg = db.config();
		std::cout << "entries:          " << st.entries << "\n";
		std::cout << "pages:            " << st.pages << "\n";
		std::cout << "splits:           " << st.splits << "\n";
		std::cout << "merges:           " << st.merges << "\n";
		std::cout << "min/max entries:  " << cfg.min_entries << "/" << cfg.max_entries << "\n";
		std::cout << "cache pages:      " << st.cache.resident << "/" << cfg.cache_pages << "\n";
		std::cout << "cache hits:       " << st.cache.hits << "\n";
		std::cout << "cache misses:     " << st.cache.misses << "\n";
		std::cout << "evictions:        " << st.cache.evictions << "\n";
		std::cout << "page writes:      " << st.cache.writes << "\n";
		std::cout << "failed writes:    " << st.cache.failed_writebacks << "\n";
		return 0;
	}

	void cmd_help() {
		std::cout << "\nstratakv Available Commands:\n";
		std::cout << "  put <key> <value>     - Insert or overwrite a key\n";
		std::cout << "  get <key>             - Print the value of a key\n";
		std::cout << "  rm <key>              - Remove a key\n";
		std::cout << "  scan [from] [limit]   - List entries in key order\n";
		std::cout << "  pages                 - Walk the page chain\n";
		std::cout << "  verify                - Check the page chain and fences\n";
		std::cout << "  stat                  - Show store statistics\n";
		std::cout << "  flush                 - Write every dirty page\n";
		std::cout << "  help                  - Show this help\n";
		std::cout << "  exit/quit             - Exit shell\n\n";
	}

	// Opens the store, runs `fn` on it and closes it again.
	template <typename Fn>
	int with_store(const options& opts, Fn&& fn) {
		strata::core::set_log_level(strata::core::parse_log_level(opts.log_level));
		try {
			backing_type dev(opts.directory);
			if (!dev.is_open()) {
				std::cerr << "Cannot open store directory: " << opts.directory << "\n";
				return 1;
			}
			store_type db(dev, opts.store_settings());
			db.open();
			const int rc = fn(db);
			db.close();
			return rc;
		}
		catch (const std::exception& e) {
			std::cerr << "Error: " << e.what() << "\n";
			return 1;
		}
	}

	void shell_loop(store_type& db, const std::string& directory) {
		replxx::Replxx rx;
		rx.set_max_history_size(128);

		std::cout << "stratakv shell - " << directory << "\n";
		std::cout << "Type 'help' for commands, 'exit' to quit\n\n";

		while (true) {
			const char* input = rx.input("strata> ");
			if (!input) break;

			std::string line(input);
			if (line.empty()) continue;
			if (line == "exit" || line == "quit") break;

			std::vector<std::string> args = split_command(line);
			if (args.empty()) continue;

			const auto& cmd = args[0];

			if (cmd == "help") {
				cmd_help();
			}
			else if (cmd == "put") {
				if (args.size() > 2) {
					cmd_put(db, args[1], args[2]);
				}
				else {
					std::cerr << "Usage: put <key> <value>\n";
				}
			}
			else if (cmd == "get") {
				if (args.size() > 1) {
					cmd_get(db, args[1]);
				}
				else {
					std::cerr << "Usage: get <key>\n";
				}
			}
			else if (cmd == "rm") {
				if (args.size() > 1) {
					cmd_rm(db, args[1]);
				}
				else {
					std::cerr << "Usage: rm <key>\n";
				}
			}
			else if (cmd == "scan") {
				std::optional<std::string> from;
				std::size_t limit = 20;
				if (args.size() > 1) {
					from = args[1];
				}
				if (args.size() > 2) {
					try {
						limit = static_cast<std::size_t>(std::stoull(args[2]));
					}
					catch (const std::exception&) {
						std::cerr << "Bad limit: " << args[2] << "\n";
						continue;
					}
				}
				cmd_scan(db, from, limit);
			}
			else if (cmd == "pages") {
				cmd_pages(db);
			}
			else if (cmd == "verify") {
				cmd_verify(db);
			}
			else if (cmd == "stat") {
				cmd_stat(db);
			}
			else if (cmd == "flush") {
				try {
					db.flush_all();
				}
				catch (const std::exception& e) {
					std::cerr << "Error flushing: " << e.what() << "\n";
				}
			}
			else {
				std::cerr << "Unknown command: " << cmd << " (type 'help' for available commands)\n";
			}

			rx.history_add(line);
		}
	}
}

int main(int argc, char* argv[]) {
	CLI::App app{ "stratakv - paged ordered key-value store" };

	options opts;
	app.add_option("directory", opts.directory, "Store directory")->required();
	app.add_option("--min-entries", opts.cfg.min_entries, "Merge threshold")
		->capture_default_str();
	app.add_option("--max-entries", opts.cfg.max_entries, "Split threshold")
		->capture_default_str();
	app.add_option("--cache-pages", opts.cfg.cache_pages, "Resident page limit")
		->capture_default_str();
	app.add_option("--scan-batch", opts.cfg.scan_batch, "Entries copied per scan batch")
		->capture_default_str();
	app.add_option("--capacity-wait-ms", opts.capacity_wait_ms, "How long a full cache waits for a free frame")
		->capture_default_str()
		->check(CLI::NonNegativeNumber);
	app.add_option("--io-retries", opts.cfg.io_retry.max_attempts, "Attempts per backing store operation")
		->capture_default_str();
	app.add_option("--io-backoff-us", opts.io_backoff_us, "First retry backoff, doubled per attempt")
		->capture_default_str()
		->check(CLI::NonNegativeNumber);
	app.add_option("--log-level", opts.log_level, "debug, info, warn, error or off")
		->capture_default_str();

	app.require_subcommand(1);

	std::string key;
	std::string value;
	std::string from;
	std::size_t limit = std::numeric_limits<std::size_t>::max();
	int rc = 0;

	auto shell_cmd = app.add_subcommand("shell", "Interactive shell mode");
	shell_cmd->callback([&]() {
		rc = with_store(opts, [&](store_type& db) {
			shell_loop(db, opts.directory);
			return 0;
			});
		});

	auto put_cmd = app.add_subcommand("put", "Insert or overwrite a key");
	put_cmd->add_option("key", key, "Key")->required();
	put_cmd->add_option("value", value, "Value")->required();
	put_cmd->callback([&]() {
		rc = with_store(opts, [&](store_type& db) { return cmd_put(db, key, value); });
		});

	auto get_cmd = app.add_subcommand("get", "Print the value of a key");
	get_cmd->add_option("key", key, "Key")->required();
	get_cmd->callback([&]() {
		rc = with_store(opts, [&](store_type& db) { return cmd_get(db, key); });
		});

	auto rm_cmd = app.add_subcommand("rm", "Remove a key");
	rm_cmd->add_option("key", key, "Key")->required();
	rm_cmd->callback([&]() {
		rc = with_store(opts, [&](store_type& db) { return cmd_rm(db, key); });
		});

	auto scan_cmd = app.add_subcommand("scan", "List entries in key order");
	auto from_opt = scan_cmd->add_option("--from", from, "First key to list");
	scan_cmd->add_option("--limit", limit, "Maximum number of entries");
	scan_cmd->callback([&]() {
		std::optional<std::string> start;
		if (from_opt->count() > 0) {
			start = from;
		}
		rc = with_store(opts, [&](store_type& db) { return cmd_scan(db, start, limit); });
		});

	auto pages_cmd = app.add_subcommand("pages", "Walk the page chain");
	pages_cmd->callback([&]() {
		rc = with_store(opts, [&](store_type& db) { return cmd_pages(db); });
		});

	auto verify_cmd = app.add_subcommand("verify", "Check the page chain and fences");
	verify_cmd->callback([&]() {
		rc = with_store(opts, [&](store_type& db) { return cmd_verify(db); });
		});

	auto stat_cmd = app.add_subcommand("stat", "Show store statistics");
	stat_cmd->callback([&]() {
		rc = with_store(opts, [&](store_type& db) { return cmd_stat(db); });
		});

	CLI11_PARSE(app, argc, argv);

	return rc;
}
