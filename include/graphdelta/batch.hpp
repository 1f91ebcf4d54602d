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

#pragma once

#include "metrics.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace graphdelta {

namespace fs = std::filesystem;

// Callback for progress reporting
using BatchProgressCallback =
    std::function<void(const std::string &file, size_t current, size_t total)>;

// Batch configuration
struct BatchConfig {
    std::string before_dir;
    std::string after_dir;
    bool verbose = false;
    BatchProgressCallback progress_callback = nullptr;

    // Threading config
    unsigned int num_threads = 0; // 0 = auto-detect

    // File patterns to ignore
    std::vector<std::string> ignore_patterns = {"build",  "node_modules", "__pycache__", ".git",
                                                ".venv",  "venv",         "dist",        "target",
                                                ".cache", "CMakeFiles"};

    CompareOptions compare;
};

// One before/after file pair
struct FileComparison {
    std::string path; // Relative to both roots
    bool before_exists = false;
    bool after_exists = false;
    std::string error; // Set when a side could not be read
    std::vector<MetricRecord> metrics;

    json to_json() const;
};

// Aggregate over the successful records of one kind
struct KindSummary {
    size_t count = 0;
    size_t failures = 0;
    double sum = 0.0;
    double max = 0.0;

    double average() const { return count > 0 ? sum / static_cast<double>(count) : 0.0; }

    json to_json() const;
};

class BatchRunner {
public:

    explicit BatchRunner(const BatchConfig &config = BatchConfig{});

    // Compare every file pair; results are ordered by relative path
    std::vector<FileComparison> run();

    // Get statistics
    struct Stats {
        std::atomic<size_t> files_compared{0};
        std::atomic<size_t> files_failed{0};
        std::atomic<size_t> metrics_failed{0};
    };
    const Stats &stats() const { return stats_; }

    unsigned int num_threads() const { return config_.num_threads; }

    static std::map<GraphKind, KindSummary> summarize(const std::vector<FileComparison> &results);

    // {metadata, files[], summary}
    json report(const std::vector<FileComparison> &results) const;

    void save_report(const std::vector<FileComparison> &results, const std::string &filepath) const;

private:

    BatchConfig config_;
    Stats stats_;

    // Thread synchronization
    std::mutex output_mutex_;

    // Relative paths of the source files under `root`
    std::vector<std::string> discover_files(const std::string &root) const;

    // Check if a relative path should be ignored
    bool should_ignore(const fs::path &path) const;

    // Compare one pair (thread-safe)
    FileComparison compare_file(const std::string &relative_path);

    // Worker function for thread pool
    void worker_compare_files(const std::vector<std::string> &files, size_t start_idx,
                              size_t end_idx, std::vector<FileComparison> &results);
};

// Read a whole file; throws std::runtime_error if it cannot be opened
std::string read_source_file(const std::string &filepath);

} // namespace graphdelta
