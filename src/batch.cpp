// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "graphdelta/batch.hpp"
#include "graphdelta/version.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace graphdelta {

std::string read_source_file(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filepath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

json FileComparison::to_json() const {
    json j;
    j["path"] = path;
    j["before_exists"] = before_exists;
    j["after_exists"] = after_exists;
    if (!error.empty())
        j["error"] = error;
    json records = json::array();
    for (const auto &record : metrics) {
        records.push_back(record.to_json());
    }
    j["metrics"] = records;
    return j;
}

json KindSummary::to_json() const {
    return {{"count", count},
            {"failures", failures},
            {"sum", sum},
            {"avg", average()},
            {"max", max}};
}

BatchRunner::BatchRunner(const BatchConfig &config) : config_(config) {
    // Auto-detect thread count if not specified
    if (config_.num_threads == 0) {
        config_.num_threads = std::thread::hardware_concurrency();
        if (config_.num_threads == 0)
            config_.num_threads = 4; // Fallback
    }
}

bool BatchRunner::should_ignore(const fs::path &path) const {
    for (const auto &component : path) {
        std::string comp = component.string();
        for (const auto &pattern : config_.ignore_patterns) {
            if (comp == pattern)
                return true;
        }
        // Hidden files/directories
        if (!comp.empty() && comp[0] == '.' && comp != "." && comp != "..")
            return true;
    }
    return false;
}

std::vector<std::string> BatchRunner::discover_files(const std::string &root_path) const {
    std::vector<std::string> files;

    fs::path root(root_path);
    if (root_path.empty() || !fs::exists(root)) {
        std::cerr << "Error: Path does not exist: " << root_path << std::endl;
        return files;
    }

    // Iterative directory traversal
    std::vector<fs::path> dirs_to_visit;
    dirs_to_visit.push_back(root);

    while (!dirs_to_visit.empty()) {
        fs::path current_dir = dirs_to_visit.back();
        dirs_to_visit.pop_back();

        std::error_code ec;
        for (const auto &entry : fs::directory_iterator(current_dir, ec)) {
            std::error_code rel_ec;
            fs::path relative = fs::relative(entry.path(), root, rel_ec);
            if (rel_ec || should_ignore(relative))
                continue;

            if (entry.is_directory()) {
                dirs_to_visit.push_back(entry.path());
            } else if (entry.is_regular_file() &&
                       language_from_extension(entry.path().extension().string()) !=
                           Language::Unknown) {
                files.push_back(relative.generic_string());
            }
        }
        if (ec && config_.verbose) {
            std::cerr << "Warning: cannot list " << current_dir.string() << ": " << ec.message()
                      << std::endl;
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

FileComparison BatchRunner::compare_file(const std::string &relative_path) {
    FileComparison comparison;
    comparison.path = relative_path;

    fs::path before_path = fs::path(config_.before_dir) / relative_path;
    fs::path after_path = fs::path(config_.after_dir) / relative_path;
    comparison.before_exists = fs::is_regular_file(before_path);
    comparison.after_exists = fs::is_regular_file(after_path);

    try {
        // A side missing from its root compares as an empty module
        std::string before = comparison.before_exists ? read_source_file(before_path.string()) : "";
        std::string after = comparison.after_exists ? read_source_file(after_path.string()) : "";
        comparison.metrics = compare_sources(before, after, config_.compare);
    } catch (const std::exception &e) {
        comparison.error = e.what();
    }
    return comparison;
}

void BatchRunner::worker_compare_files(const std::vector<std::string> &files, size_t start_idx,
                                       size_t end_idx, std::vector<FileComparison> &results) {
    for (size_t i = start_idx; i < end_idx; ++i) {
        // Each worker owns results[start_idx, end_idx)
        results[i] = compare_file(files[i]);
        const FileComparison &comparison = results[i];

        if (!comparison.error.empty()) {
            stats_.files_failed++;
        } else {
            stats_.files_compared++;
        }
        for (const auto &record : comparison.metrics) {
            if (!record.ok)
                stats_.metrics_failed++;
        }

        if (config_.verbose || config_.progress_callback) {
            // Print progress (with lock to avoid garbled output)
            std::lock_guard<std::mutex> lock(output_mutex_);
            size_t done = stats_.files_compared + stats_.files_failed;
            if (config_.progress_callback)
                config_.progress_callback(comparison.path, done, files.size());
            if (config_.verbose) {
                std::cout << "Compared: " << comparison.path;
                if (!comparison.error.empty())
                    std::cout << " (error: " << comparison.error << ")";
                std::cout << std::endl;
            }
        }
    }
}

std::vector<FileComparison> BatchRunner::run() {
    // Phase 1: Discover and pair files by relative path
    std::set<std::string> paired;
    for (auto &path : discover_files(config_.before_dir))
        paired.insert(std::move(path));
    for (auto &path : discover_files(config_.after_dir))
        paired.insert(std::move(path));
    std::vector<std::string> files(paired.begin(), paired.end());

    std::vector<FileComparison> results(files.size());
    if (files.empty()) {
        std::cout << "No source files found to compare." << std::endl;
        return results;
    }

    if (config_.verbose) {
        std::cout << "Found " << files.size() << " file pairs to compare." << std::endl;
        std::cout << "Using " << config_.num_threads << " threads." << std::endl;
    }

    // Phase 2: Parallel comparison
    std::vector<std::thread> threads;
    size_t files_per_thread = (files.size() + config_.num_threads - 1) / config_.num_threads;

    for (unsigned int t = 0; t < config_.num_threads; ++t) {
        size_t start_idx = t * files_per_thread;
        size_t end_idx = std::min(start_idx + files_per_thread, files.size());

        if (start_idx >= files.size())
            break;

        threads.emplace_back(&BatchRunner::worker_compare_files, this, std::cref(files),
                             start_idx, end_idx, std::ref(results));
    }

    // Wait for all threads
    for (auto &t : threads) {
        t.join();
    }

    if (config_.verbose) {
        std::cout << "\nComparison complete. " << stats_.files_compared << " files compared, "
                  << stats_.files_failed << " unreadable, " << stats_.metrics_failed
                  << " metrics failed." << std::endl;
    }
    return results;
}

std::map<GraphKind, KindSummary> BatchRunner::summarize(const std::vector<FileComparison> &results) {
    std::map<GraphKind, KindSummary> summary;
    for (const auto &comparison : results) {
        for (const auto &record : comparison.metrics) {
            KindSummary &kind = summary[record.kind];
            if (!record.ok) {
                kind.failures++;
                continue;
            }
            kind.count++;
            kind.sum += record.ged.distance;
            kind.max = std::max(kind.max, record.ged.distance);
        }
    }
    return summary;
}

json BatchRunner::report(const std::vector<FileComparison> &results) const {
    json j;

    json metadata;
    metadata["tool"] = "graphdelta";
    metadata["version"] = VERSION_STRING;
    metadata["schema_version"] = REPORT_SCHEMA_VERSION;
    metadata["before_dir"] = config_.before_dir;
    metadata["after_dir"] = config_.after_dir;
    metadata["dfg_variant"] = dfg_variant_to_string(config_.compare.dfg_variant);
    metadata["strategy"] = ged_strategy_to_string(config_.compare.ged.strategy);
    metadata["file_count"] = results.size();
    j["metadata"] = metadata;

    json files = json::array();
    for (const auto &comparison : results) {
        files.push_back(comparison.to_json());
    }
    j["files"] = files;

    json summary = json::object();
    for (const auto &[kind, kind_summary] : summarize(results)) {
        summary[graph_kind_to_string(kind)] = kind_summary.to_json();
    }
    j["summary"] = summary;
    return j;
}

void BatchRunner::save_report(const std::vector<FileComparison> &results,
                              const std::string &filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filepath);
    }
    file << report(results).dump(2);
}

} // namespace graphdelta
