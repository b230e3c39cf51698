#include "strata/undofile.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace strata;

int main() {
    namespace fs = std::filesystem;
    fs::create_directories("bench_tmp");
    const fs::path live = "bench_tmp/doc.txt";
    const fs::path undo_path = "bench_tmp/doc.undo";

    // Build a 20k-revision history of single-character inserts with a branch
    // every 64 edits
    const int N = 20000;
    History history;
    std::string doc;
    auto t = std::chrono::system_clock::now();
    for (int i = 0; i < N; ++i) {
        if (i % 64 == 63) history.undo();
        Transaction tx;
        tx.changes.retain(doc.size());
        tx.changes.insert(std::string(1, static_cast<char>('a' + i % 26)));
        Transaction inv = tx.invert(doc);
        doc.push_back(static_cast<char>('a' + i % 26));
        history.record(std::move(tx), std::move(inv), Selection::point(doc.size()), t);
        t += std::chrono::milliseconds(1);
        if (i % 64 == 63) doc.clear(); // document content is irrelevant to the codec
    }
    {
        std::ofstream out(live, std::ios::binary | std::ios::trunc);
        out << doc;
    }

    UndoFile file(undo_path);
    auto t0 = std::chrono::high_resolution_clock::now();
    file.save(history, live, history.currentRevision(), 0);
    auto t1 = std::chrono::high_resolution_clock::now();
    LoadedHistory loaded = file.load(live);
    auto t2 = std::chrono::high_resolution_clock::now();

    auto save_ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
    auto load_ms = std::chrono::duration_cast<std::chrono::microseconds>(t2 - t1).count() / 1000.0;
    std::cout << "revisions=" << history.size() << ", bytes=" << fs::file_size(undo_path)
              << ", save_ms=" << save_ms << ", load_ms=" << load_ms << "\n";
    // Print to keep the load from being optimized away
    std::cerr << "loaded=" << loaded.history.size() << "\n";
    return 0;
}
