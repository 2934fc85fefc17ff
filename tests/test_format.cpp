#include <catch2/catch.hpp>

#include "ps3update/errors.hpp"
#include "ps3update/format.hpp"

#include <algorithm>
#include <string>
#include <vector>

using ps3update::Error;
using ps3update::ErrorKind;

namespace {

ErrorKind kindOf(const std::string& raw) {
    try {
        (void)ps3update::cleanTitleId(raw);
    } catch (const Error& ex) {
        return ex.kind();
    }
    FAIL("cleanTitleId accepted " << raw);
    return ErrorKind::Config;
}

} // namespace

TEST_CASE("cleanTitleId normalizes case and separators") {
    REQUIRE(ps3update::cleanTitleId("bles-00799") == "BLES00799");
    REQUIRE(ps3update::cleanTitleId("BLES 00799") == "BLES00799");
    REQUIRE(ps3update::cleanTitleId("BLES00799") == "BLES00799");
    REQUIRE(ps3update::cleanTitleId("  npub_30091 ") == "NPUB30091");
}

TEST_CASE("cleanTitleId is idempotent") {
    const auto once = ps3update::cleanTitleId("bcus-98174");
    REQUIRE(ps3update::cleanTitleId(once) == once);
}

TEST_CASE("cleanTitleId rejects malformed ids") {
    REQUIRE(kindOf("") == ErrorKind::InvalidTitleId);
    REQUIRE(kindOf("   ") == ErrorKind::InvalidTitleId);
    REQUIRE(kindOf("BLES0079") == ErrorKind::InvalidTitleId);
    REQUIRE(kindOf("BLES007999") == ErrorKind::InvalidTitleId);
    REQUIRE(kindOf("BLE100799") == ErrorKind::InvalidTitleId);
    REQUIRE(kindOf("BLES00799!") == ErrorKind::InvalidTitleId);
    REQUIRE(kindOf("BLES0079X") == ErrorKind::InvalidTitleId);
}

TEST_CASE("invalid title id message names the problem") {
    try {
        (void)ps3update::cleanTitleId("abc");
        FAIL("expected an error");
    } catch (const Error& ex) {
        REQUIRE(std::string(ex.what()).rfind("Invalid title ID: ", 0) == 0);
    }
}

TEST_CASE("formatSize uses binary units with two decimals") {
    REQUIRE(ps3update::formatSize(123456789) == "117.74 MB");
    REQUIRE(ps3update::formatSize(512) == "512.00 B");
    REQUIRE(ps3update::formatSize(1024) == "1.00 KB");
    REQUIRE(ps3update::formatSize(1536) == "1.50 KB");
    REQUIRE(ps3update::formatSize(5ULL * 1024 * 1024 * 1024) == "5.00 GB");
}

TEST_CASE("formatSize reports zero as unknown") {
    REQUIRE(ps3update::formatSize(0) == "Unknown");
}

TEST_CASE("formatSpeed appends per-second suffix") {
    REQUIRE(ps3update::formatSpeed(0.0) == "0 B/s");
    REQUIRE(ps3update::formatSpeed(-5.0) == "0 B/s");
    REQUIRE(ps3update::formatSpeed(2048.0) == "2.00 KB/s");
}

TEST_CASE("compareVersions compares components numerically") {
    REQUIRE(ps3update::compareVersions("1.10", "1.2") > 0);
    REQUIRE(ps3update::compareVersions("1.2", "1.10") < 0);
    REQUIRE(ps3update::compareVersions("2.0", "1.99") > 0);
    REQUIRE(ps3update::compareVersions("1.0", "1") > 0);
    REQUIRE(ps3update::compareVersions("1.05", "1.05") == 0);
}

TEST_CASE("compareVersions breaks numeric ties on the raw text") {
    REQUIRE(ps3update::compareVersions("1.2", "1.02") > 0);
    REQUIRE(ps3update::compareVersions("1.02", "1.2") < 0);
}

TEST_CASE("sorting with compareVersions puts newest first") {
    std::vector<std::string> versions{"1.02", "1.10", "1.2"};
    std::stable_sort(versions.begin(), versions.end(), [](const std::string& a, const std::string& b) {
        return ps3update::compareVersions(a, b) > 0;
    });
    REQUIRE(versions == std::vector<std::string>{"1.10", "1.2", "1.02"});
}

TEST_CASE("filenameFromUrl takes the last path segment") {
    REQUIRE(ps3update::filenameFromUrl("http://b0.ww.np.dl.playstation.net/tppkg/np/BLES00799/EP0001-BLES00799_00-PATCH-A0105-V0100-PE.pkg") ==
            "EP0001-BLES00799_00-PATCH-A0105-V0100-PE.pkg");
    REQUIRE(ps3update::filenameFromUrl("http://host/dir/file.pkg?token=1#frag") == "file.pkg");
    REQUIRE(ps3update::filenameFromUrl("http://host/dir/") == "update.pkg");
    REQUIRE(ps3update::filenameFromUrl("http://host") == "update.pkg");
    REQUIRE(ps3update::filenameFromUrl("") == "update.pkg");
}

TEST_CASE("sanitizeFolderName replaces reserved characters") {
    REQUIRE(ps3update::sanitizeFolderName("Demon's Souls (BLES00932)") == "Demon's Souls (BLES00932)");
    REQUIRE(ps3update::sanitizeFolderName("A/B\\C:D*E?F\"G<H>I|J") == "A_B_C_D_E_F_G_H_I_J");
}

TEST_CASE("errors carry their kind and a prefixed message") {
    const Error network(ErrorKind::NetworkError, "Timeout was reached");
    REQUIRE(network.kind() == ErrorKind::NetworkError);
    REQUIRE(network.detail() == "Timeout was reached");
    REQUIRE(std::string(network.what()) == "Network error: Timeout was reached");
    REQUIRE(std::string(ps3update::errorKindLabel(network.kind())) == "NetworkError");

    const Error disk = ps3update::makeError(ErrorKind::IoError, "write to {} failed", "/tmp/x.pkg");
    REQUIRE(std::string(disk.what()) == "File system error: write to /tmp/x.pkg failed");

    const Error cancelled(ErrorKind::Cancelled, "ignored");
    REQUIRE(std::string(cancelled.what()) == "Download cancelled");
}
