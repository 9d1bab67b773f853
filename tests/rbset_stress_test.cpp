// rbset_stress_test.cpp
// Concurrent readers and writers over LockedSet
// ---------------------------------------------
// Writers update the set and a reference map inside one write() call, so
// the two never drift apart; readers look up random keys; a validator
// thread checks the red-black invariants under the shared lock.  The run
// ends with a full invariant check and a comparison against the reference.

#include <atomic>
#include <chrono>
#include <limits>
#include <map>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "rbset/locked_set.hpp"
#include "rbset/util/print.hpp"
#include "rbset/util/printer.hpp"

namespace {

// Key/value record ordered by key; an override insert replaces the value,
// which is what the reference map's operator[] does too.
struct Record {
    int key;
    int value;
};

struct ByKey {
    bool operator()(const Record& a, const Record& b) const { return a.key < b.key; }
};

using Set = rbset::LockedSet<Record, ByKey>;
using Reference = std::map<int, int>;

// Configuration parameters
struct TestConfig {
    size_t num_reader_threads = 4;        // Number of reader threads
    size_t num_writer_threads = 2;        // Number of writer threads
    size_t initial_elements = 5000;       // Elements to insert before test starts
    size_t operations_per_thread = 50000; // Operations each thread performs
    size_t key_range = 20000;             // Range of possible keys (0 to key_range-1)
    double insert_ratio = 0.5;            // Probability of insert vs. delete for writers
    size_t validation_interval = 5000;    // How often workers validate (operations)
    std::chrono::milliseconds test_duration{2000}; // Maximum test duration
};

// Statistics tracking
struct TestStats {
    std::atomic<size_t> total_lookups{0};
    std::atomic<size_t> successful_lookups{0};
    std::atomic<size_t> total_inserts{0};
    std::atomic<size_t> new_keys{0};
    std::atomic<size_t> total_deletes{0};
    std::atomic<size_t> successful_deletes{0};
    std::atomic<size_t> validation_count{0};
    std::atomic<bool> validation_failed{false};
    std::atomic<bool> reference_mismatch{false};
};

class RandomGenerator {
private:
    std::mt19937 gen;
    std::uniform_int_distribution<int> key_dist;
    std::uniform_int_distribution<int> val_dist;
    std::uniform_real_distribution<double> op_dist{0.0, 1.0};

public:
    RandomGenerator(size_t key_range, size_t seed)
        : gen(static_cast<std::mt19937::result_type>(seed)),
          key_dist(0, static_cast<int>(key_range) - 1),
          val_dist(0, std::numeric_limits<int>::max()) {}

    int random_key() { return key_dist(gen); }
    int random_value() { return val_dist(gen); }
    double random_probability() { return op_dist(gen); }
};

void validate(const Set& set, TestStats& stats, rbset::util::printer& out, const char* context) {
    const rbset::Violation v = set.check();
    stats.validation_count++;
    if (v != rbset::Violation::NONE) {
        out.log(rbset::util::level::error, "validation failed during {}: {}", context, rbset::to_string(v));
        stats.validation_failed = true;
    }
}

void initialize(Set& set, Reference& reference, const TestConfig& config) {
    // deterministic seed for reproducibility
    RandomGenerator rng(config.key_range, 42);
    set.write([&](Set::SetT& s) {
        for (size_t i = 0; i < config.initial_elements; ++i) {
            const int key = rng.random_key();
            const int val = rng.random_value();
            s.insert(Record{key, val});
            reference[key] = val;
        }
    });
}

void reader_thread_func(const Set& set, const TestConfig& config, TestStats& stats,
                        rbset::util::printer& out, const std::atomic<bool>& stop_flag,
                        size_t thread_id) {
    RandomGenerator rng(config.key_range, thread_id + 1000);
    size_t ops = 0;
    size_t hits = 0;

    auto start_time = std::chrono::steady_clock::now();

    while (!stop_flag.load() && ops < config.operations_per_thread) {
        const int key = rng.random_key();
        auto found = set.find(Record{key, 0});
        stats.total_lookups++;
        if (found) {
            if (found->key != key) stats.reference_mismatch = true;
            hits++;
            stats.successful_lookups++;
        }
        ops++;

        if (ops % config.validation_interval == 0) validate(set, stats, out, "reader thread");
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    out.print("Reader {} completed {} lookups ({} hits) in {}ms", thread_id, ops, hits, duration.count());
}

void writer_thread_func(Set& set, Reference& reference, const TestConfig& config, TestStats& stats,
                        rbset::util::printer& out, const std::atomic<bool>& stop_flag,
                        size_t thread_id) {
    RandomGenerator rng(config.key_range, thread_id + 2000);
    size_t inserts = 0;
    size_t deletes = 0;

    auto start_time = std::chrono::steady_clock::now();

    while (!stop_flag.load() && (inserts + deletes) < config.operations_per_thread) {
        const int key = rng.random_key();

        if (rng.random_probability() < config.insert_ratio) {
            const int val = rng.random_value();
            const bool fresh = set.write([&](Set::SetT& s) {
                const bool added = !s.insert(Record{key, val}).has_value();
                const bool ref_added = reference.find(key) == reference.end();
                reference[key] = val;
                if (added != ref_added) stats.reference_mismatch = true;
                return added;
            });
            stats.total_inserts++;
            if (fresh) stats.new_keys++;
            inserts++;
        } else {
            const bool erased = set.write([&](Set::SetT& s) {
                auto removed = s.remove(Record{key, 0});
                auto it = reference.find(key);
                const bool ref_had = it != reference.end();
                if (removed.has_value() != ref_had || (ref_had && removed->value != it->second))
                    stats.reference_mismatch = true;
                if (ref_had) reference.erase(it);
                return removed.has_value();
            });
            stats.total_deletes++;
            if (erased) stats.successful_deletes++;
            deletes++;
        }

        if ((inserts + deletes) % config.validation_interval == 0) validate(set, stats, out, "writer thread");
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    out.print("Writer {} completed {} inserts + {} deletes in {}ms", thread_id, inserts, deletes,
              duration.count());
}

void validator_thread_func(const Set& set, TestStats& stats, rbset::util::printer& out,
                           const std::atomic<bool>& stop_flag) {
    while (!stop_flag.load()) {
        validate(set, stats, out, "validator thread");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

bool compare_with_reference(const Set& set, const Reference& reference) {
    return set.read([&](const Set::SetT& s) {
        if (s.size() != reference.size()) {
            rbset::util::log(rbset::util::level::error, "size mismatch: set={} reference={}", s.size(),
                             reference.size());
            return false;
        }
        auto ref = reference.begin();
        for (const Record& r : s) {
            if (r.key != ref->first || r.value != ref->second) {
                rbset::util::log(rbset::util::level::error, "mismatch at key {}: reference={}:{}", r.key,
                                 ref->first, ref->second);
                return false;
            }
            ++ref;
        }
        return true;
    });
}

bool run_stress_test(const std::string& name, const TestConfig& config) {
    rbset::util::println("\n======= {} =======", name);
    rbset::util::println("- Reader threads: {}\n- Writer threads: {}\n- Initial elements: {}\n- Key range: {}",
                         config.num_reader_threads, config.num_writer_threads, config.initial_elements,
                         config.key_range);

    Set set;
    Reference reference;
    initialize(set, reference, config);

    if (!set.validate()) {
        rbset::util::log(rbset::util::level::error, "initial tree is invalid");
        return false;
    }

    TestStats stats;
    std::atomic<bool> stop_flag(false);
    auto start_time = std::chrono::steady_clock::now();

    {
        rbset::util::printer out(0);

        std::vector<std::thread> threads;
        for (size_t i = 0; i < config.num_reader_threads; i++) {
            threads.emplace_back(reader_thread_func, std::cref(set), std::cref(config), std::ref(stats),
                                 std::ref(out), std::cref(stop_flag), i);
        }
        for (size_t i = 0; i < config.num_writer_threads; i++) {
            threads.emplace_back(writer_thread_func, std::ref(set), std::ref(reference), std::cref(config),
                                 std::ref(stats), std::ref(out), std::cref(stop_flag), i);
        }
        std::thread validator(validator_thread_func, std::cref(set), std::ref(stats), std::ref(out),
                              std::cref(stop_flag));

        std::this_thread::sleep_for(config.test_duration);
        stop_flag.store(true);

        for (auto& t : threads) t.join();
        validator.join();
        out.stop();
    }

    auto runtime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    const bool final_valid = set.validate();
    const bool comparison_valid = compare_with_reference(set, reference);

    rbset::util::println("Runtime: {} ms", runtime.count());
    rbset::util::println("Lookups: {} (hits: {})", stats.total_lookups.load(), stats.successful_lookups.load());
    rbset::util::println("Inserts: {} (new keys: {})", stats.total_inserts.load(), stats.new_keys.load());
    rbset::util::println("Deletes: {} (successful: {})", stats.total_deletes.load(),
                         stats.successful_deletes.load());
    rbset::util::println("Validations performed: {}", stats.validation_count.load());

    const bool passed = final_valid && comparison_valid && !stats.validation_failed.load() &&
                        !stats.reference_mismatch.load();
    if (passed) {
        rbset::util::println("  ✔ {}", name);
    } else {
        if (!final_valid) rbset::util::println("  - Final tree validation failed");
        if (!comparison_valid) rbset::util::println("  - Tree comparison with reference failed");
        if (stats.validation_failed.load()) rbset::util::println("  - A validation during the run failed");
        if (stats.reference_mismatch.load()) rbset::util::println("  - An operation disagreed with the reference");
    }
    return passed;
}

}  // namespace

int main() {
    rbset::util::println("==== LockedSet Stress Test ====");
    rbset::util::println("Running on system with {} hardware threads", std::thread::hardware_concurrency());

    bool ok = true;

    {
        TestConfig config;
        ok = run_stress_test("default configuration", config) && ok;
    }

    // Small key range increases contention on the same nodes
    {
        TestConfig config;
        config.num_reader_threads = 2;
        config.num_writer_threads = 4;
        config.key_range = 500;
        config.initial_elements = 300;
        ok = run_stress_test("high writer contention", config) && ok;
    }

    {
        TestConfig config;
        config.num_reader_threads = 8;
        config.num_writer_threads = 1;
        config.insert_ratio = 0.7;
        ok = run_stress_test("read-heavy workload", config) && ok;
    }

    if (!ok) {
        rbset::util::println("\n==== STRESS TEST FAILED ====");
        return 1;
    }
    rbset::util::println("\n==== STRESS TEST PASSED ====");
    return 0;
}
