#include "media/MetadataFetcher.hpp"
#include "TestSupport.hpp"

#include <cassert>
#include <iostream>

namespace {

using Yturl::MediaMetadata;
using Yturl::MetadataErrorKind;
using Yturl::MetadataFetcher;
using YturlTest::FakeToolRunner;

const char* SampleDocument = R"({"id":"abc","title":"A clip","uploader":null,"channel":"Some Channel",)"
                             R"("duration":125.4,"thumbnail":"https://i.ytimg.com/vi/abc/hq.jpg","formats":[)"
                             R"({"format_id":"137","ext":"mp4","height":1080,"vcodec":"avc1","acodec":"none","filesize":1000},)"
                             R"({"format_id":"22","ext":"mp4","height":720,"vcodec":"avc1","acodec":"mp4a","filesize":null,"filesize_approx":500},)"
                             R"({"format_id":"140","ext":"m4a","height":null,"vcodec":"none","acodec":"mp4a","abr":129.5},)"
                             R"({"format_id":"251","ext":"webm","vcodec":"none","acodec":"opus","abr":null,"tbr":160.0}]})";

void TestParseMapsFieldsAndFallbacks() {
    MediaMetadata metadata;
    assert(MetadataFetcher::parseMetadata(SampleDocument, metadata));

    assert(metadata.id == "abc");
    assert(metadata.title == "A clip");
    assert(metadata.uploaderName == "Some Channel");
    assert(metadata.durationSeconds == 125.4);
    assert(metadata.thumbnailUrl == "https://i.ytimg.com/vi/abc/hq.jpg");
    assert(metadata.formats.size() == 4);

    const auto& exact = metadata.formats[0];
    assert(exact.formatId == "137" && exact.height == 1080 && exact.sizeBytes == 1000);
    assert(!exact.sizeIsApproximate);

    const auto& approx = metadata.formats[1];
    assert(approx.sizeBytes == 500 && approx.sizeIsApproximate);

    const auto& audio = metadata.formats[2];
    assert(audio.height == 0);
    assert(audio.bitrateKbps == 129.5);
    assert(audio.videoCodec == "none");

    assert(metadata.formats[3].bitrateKbps == 160.0);
    assert(metadata.formats[3].sizeBytes == 0);
}

void TestParseRejectsNonObjects() {
    MediaMetadata metadata;
    assert(!MetadataFetcher::parseMetadata("not json", metadata));
    assert(!MetadataFetcher::parseMetadata("[1,2,3]", metadata));
}

void TestFetchTakesFirstJsonLine() {
    auto runner = std::make_shared<FakeToolRunner>();
    runner->metadata.lines = {"WARNING: something", SampleDocument, "{\"id\":\"second\"}"};

    MetadataFetcher fetcher(runner);
    auto result = fetcher.fetch("https://youtu.be/abc");
    assert(result.success);
    assert(result.errorKind == MetadataErrorKind::None);
    assert(result.metadata.id == "abc");

    std::vector<std::string> expected = {"--dump-json", "--no-warnings", "--no-playlist", "https://youtu.be/abc"};
    assert(runner->processes().front()->args == expected);
}

void TestFetchReportsToolError() {
    auto runner = std::make_shared<FakeToolRunner>();
    runner->metadata.lines = {"[youtube] abc: Downloading", "ERROR: [youtube] abc: Video unavailable  ", "ERROR: later"};
    runner->metadata.exitCode = 1;

    MetadataFetcher fetcher(runner);
    auto result = fetcher.fetch("https://youtu.be/abc");
    assert(!result.success);
    assert(result.errorKind == MetadataErrorKind::ToolFailed);
    assert(result.error == "ERROR: [youtube] abc: Video unavailable");
    assert(result.metadata.id.empty());
}

void TestFetchReportsExitCodeWithoutDiagnostic() {
    auto runner = std::make_shared<FakeToolRunner>();
    runner->metadata.exitCode = 2;

    MetadataFetcher fetcher(runner);
    auto result = fetcher.fetch("https://youtu.be/abc");
    assert(result.errorKind == MetadataErrorKind::ToolFailed);
    assert(result.error == "metadata tool exited with code 2");
}

void TestFetchUnparseableAndSpawnFailure() {
    auto runner = std::make_shared<FakeToolRunner>();
    runner->metadata.lines = {"{broken"};

    MetadataFetcher fetcher(runner);
    auto garbled = fetcher.fetch("https://youtu.be/abc");
    assert(!garbled.success);
    assert(garbled.errorKind == MetadataErrorKind::Unparseable);
    assert(garbled.error == "unparseable metadata");

    runner->metadata.lines.clear();
    auto empty = fetcher.fetch("https://youtu.be/abc");
    assert(empty.errorKind == MetadataErrorKind::Unparseable);

    runner->metadata.failSpawn = true;
    auto missing = fetcher.fetch("https://youtu.be/abc");
    assert(missing.errorKind == MetadataErrorKind::ToolFailed);
    assert(missing.error == "failed to start metadata tool");
}

} // namespace

int main() {
    TestParseMapsFieldsAndFallbacks();
    TestParseRejectsNonObjects();
    TestFetchTakesFirstJsonLine();
    TestFetchReportsToolError();
    TestFetchReportsExitCodeWithoutDiagnostic();
    TestFetchUnparseableAndSpawnFailure();

    std::cout << "metadata_fetcher_test: pass\n";
    return 0;
}
