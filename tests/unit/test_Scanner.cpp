#include "TempTree.hpp"
#include "sync/Scanner.hpp"
#include "sync/errors.hpp"
#include "crypto/util/hash.hpp"

using namespace osync::sync;
using namespace osync::sync::model;

class ScannerTest : public TempTree {
protected:
    Scanner scanner{{"filament", "machine", "process"}, {"/cache/", ".DS_Store"}};
};

TEST_F(ScannerTest, MissingRootYieldsEmptySnapshot) {
    const auto snap = scanner.scan(root / "does-not-exist");
    EXPECT_TRUE(snap.empty());
}

TEST_F(ScannerTest, OnlyAllowListedFoldersAreIncluded) {
    put(root / "filament/pla.json", "pla");
    put(root / "process/nested/0.2mm.json", "layer");
    put(root / "printer/other.json", "ignored");
    put(root / "top-level.json", "ignored");

    const auto snap = scanner.scan(root);

    ASSERT_EQ(snap.size(), 2u);
    EXPECT_TRUE(snap.contains("filament/pla.json"));
    EXPECT_TRUE(snap.contains("process/nested/0.2mm.json"));
    EXPECT_FALSE(snap.contains("printer/other.json"));
}

TEST_F(ScannerTest, FingerprintCarriesSha256AndSize) {
    put(root / "machine/x1c.json", "abc");

    const auto snap = scanner.scan(root);
    const auto* fp = snap.find("machine/x1c.json");

    ASSERT_NE(fp, nullptr);
    EXPECT_EQ(fp->hash, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(fp->hash, osync::crypto::hash::sha256(std::string_view("abc")));
    EXPECT_EQ(fp->size, 3u);
}

TEST_F(ScannerTest, ExcludedSubstringsAreSkipped) {
    put(root / "filament/cache/tmp.json", "x");
    put(root / "filament/.DS_Store", "x");
    put(root / "filament/keep.json", "x");

    const auto snap = scanner.scan(root);

    ASSERT_EQ(snap.size(), 1u);
    EXPECT_TRUE(snap.contains("filament/keep.json"));
    EXPECT_EQ(scanner.lastStats().skipped, 2u);
}

TEST_F(ScannerTest, SymlinksAreNeverFollowed) {
    put(root / "outside/secret.json", "secret");
    put(root / "filament/real.json", "real");
    fs::create_symlink(root / "outside/secret.json", root / "filament/link.json");
    fs::create_directory_symlink(root / "outside", root / "process");

    const auto snap = scanner.scan(root);

    ASSERT_EQ(snap.size(), 1u);
    EXPECT_TRUE(snap.contains("filament/real.json"));
}

TEST_F(ScannerTest, ScanIsDeterministic) {
    put(root / "filament/b.json", "b");
    put(root / "filament/a.json", "a");
    put(root / "machine/c.json", "c");

    const auto first = scanner.scan(root);
    const auto second = scanner.scan(root);

    EXPECT_EQ(first, second);
    std::vector<std::string> keys;
    for (const auto& [path, fp] : first) keys.push_back(path);
    EXPECT_EQ(keys, (std::vector<std::string>{"filament/a.json", "filament/b.json", "machine/c.json"}));
}

TEST_F(ScannerTest, HintReusesHashWhenSizeAndMtimeMatch) {
    put(root / "filament/a.json", "a");
    put(root / "filament/b.json", "b");

    const auto first = scanner.scan(root);
    EXPECT_EQ(scanner.lastStats().hashed, 2u);

    const auto second = scanner.scan(root, &first);
    EXPECT_EQ(scanner.lastStats().hashed, 0u);
    EXPECT_EQ(scanner.lastStats().cached, 2u);
    EXPECT_EQ(first, second);
}

TEST_F(ScannerTest, HintIsIgnoredForModifiedFiles) {
    put(root / "filament/a.json", "a");
    const auto first = scanner.scan(root);

    put(root / "filament/a.json", "changed");
    const auto second = scanner.scan(root, &first);

    EXPECT_EQ(scanner.lastStats().hashed, 1u);
    EXPECT_NE(first.hashOf("filament/a.json"), second.hashOf("filament/a.json"));
}

TEST_F(ScannerTest, CacheCanBeDisabled) {
    const Scanner uncached({"filament"}, {}, false);
    put(root / "filament/a.json", "a");

    const auto first = uncached.scan(root);
    (void)uncached.scan(root, &first);

    EXPECT_EQ(uncached.lastStats().hashed, 1u);
    EXPECT_EQ(uncached.lastStats().cached, 0u);
}

TEST_F(ScannerTest, RelativeKeyUsesForwardSlashes) {
    EXPECT_EQ(Scanner::relativeKey(root, root / "process" / "sub" / "p.json"), "process/sub/p.json");
}
