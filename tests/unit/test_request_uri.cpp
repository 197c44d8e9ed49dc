#include "cacheworker/protocol/RequestUri.h"
#include "cacheworker/protocol/HttpError.h"
#include "cacheworker/common/Logger.h"

#include <cassert>
#include <string>

using namespace cacheworker::protocol;
using namespace cacheworker::common;

static bool ParseFails(const std::string& target) {
    try {
        RequestUri::Parse(target);
    } catch (const MalformedRequestError&) {
        return true;
    }
    return false;
}

void testSegmentsAndQuery() {
    RequestUri uri = RequestUri::Parse("/file/abc/page/0?offset=10&length=5");
    assert(uri.mappingPath() == "file");
    assert(uri.remainingSegments().size() == 3);
    assert(uri.remainingSegments()[0] == "abc");
    assert(uri.remainingSegments()[1] == "page");
    assert(uri.remainingSegments()[2] == "0");
    assert(uri.parameters().size() == 2);
    assert(*uri.getParameter("offset") == "10");
    assert(*uri.getInt64Parameter("length") == 5);
    assert(!uri.getParameter("missing"));
    assert(!uri.getInt64Parameter("missing"));

    RequestUri health = RequestUri::Parse("/health");
    assert(health.mappingPath() == "health");
    assert(health.remainingSegments().empty());
    assert(health.parameters().empty());

    // Empty segments vanish.
    RequestUri slashes = RequestUri::Parse("//files//a/?path=x");
    assert(slashes.mappingPath() == "files");
    assert(slashes.remainingSegments().size() == 1);
    assert(slashes.remainingSegments()[0] == "a");
    LOG_INFO << "Segments/query PASS";
}

void testQueryEdgeCases() {
    RequestUri uri = RequestUri::Parse("/load?path=%2Ftmp%2Fdata&verify&=orphan&a=1&a=2&&");
    // Values stay encoded until a handler decodes them.
    assert(*uri.getParameter("path") == "%2Ftmp%2Fdata");
    assert(uri.hasParameter("verify"));
    assert(*uri.getParameter("verify") == "");
    assert(*uri.getParameter("a") == "2");
    assert(!uri.hasParameter(""));
    assert(uri.parameters().size() == 3);

    RequestUri empty = RequestUri::Parse("/health?");
    assert(empty.parameters().empty());
    LOG_INFO << "Query edge cases PASS";
}

void testBoolAndIntParameters() {
    RequestUri uri = RequestUri::Parse("/load?verify=TRUE&verbose=yes&partialListing=false&bandwidth=12x&n=-3");
    assert(*uri.getBoolParameter("verify") == true);
    assert(*uri.getBoolParameter("verbose") == false);
    assert(*uri.getBoolParameter("partialListing") == false);
    assert(!uri.getBoolParameter("skipIfExists"));
    assert(*uri.getInt64Parameter("n") == -3);

    bool threw = false;
    try {
        uri.getInt64Parameter("bandwidth");
    } catch (const MalformedRequestError& e) {
        threw = true;
        assert(e.status() == HttpResponse::k400BadRequest);
    }
    assert(threw);
    LOG_INFO << "Bool/int parameters PASS";
}

void testMalformedTargets() {
    assert(ParseFails(""));
    assert(ParseFails("file/abc"));
    assert(ParseFails("/"));
    assert(ParseFails("/?x=1"));
    assert(ParseFails("///"));
    assert(!ParseFails("/x"));
    LOG_INFO << "Malformed targets PASS";
}

void testAbsoluteForm() {
    RequestUri uri = RequestUri::Parse("http://worker:28080/info?path=%2Fa");
    assert(uri.mappingPath() == "info");
    assert(*uri.getParameter("path") == "%2Fa");
    assert(ParseFails("http://worker:28080"));
    LOG_INFO << "Absolute form PASS";
}

void testParseInt64() {
    assert(ParseInt64("0", "x") == 0);
    assert(ParseInt64("9223372036854775807", "x") == 9223372036854775807LL);
    const char* bad[] = {"", " 1", "1 ", "abc", "12a", "99999999999999999999"};
    for (const char* text : bad) {
        bool threw = false;
        try {
            ParseInt64(text, "x");
        } catch (const MalformedRequestError&) {
            threw = true;
        }
        assert(threw);
    }
    LOG_INFO << "ParseInt64 PASS";
}

void testDecodeReserved() {
    assert(DecodeReservedCharacters("%2Ftmp%2Fdata") == "/tmp/data");
    assert(DecodeReservedCharacters("%2ftmp%3a%3F") == "/tmp:?");
    assert(DecodeReservedCharacters("/already/decoded") == "/already/decoded");
    // Only the reserved set is decoded.
    assert(DecodeReservedCharacters("a%20b%25") == "a%20b%25");
    assert(DecodeReservedCharacters("%2") == "%2");
    assert(DecodeReservedCharacters("x%2F") == "x/");

    // A second pass changes nothing, even where the first leaves a '%'.
    assert(DecodeReservedCharacters("%%2F2F") == "%/2F");
    assert(DecodeReservedCharacters("%252F") == "%252F");
    const char* inputs[] = {"%2F%3A%3F", "%%2F2F", "%252F", "%2%2F", "%%3a%3f%2f", "/plain/path", "%2F%2F%25%2F"};
    for (const char* input : inputs) {
        const std::string once = DecodeReservedCharacters(input);
        assert(DecodeReservedCharacters(once) == once);
    }
    LOG_INFO << "DecodeReservedCharacters PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testSegmentsAndQuery();
    testQueryEdgeCases();
    testBoolAndIntParameters();
    testMalformedTargets();
    testAbsoluteForm();
    testParseInt64();
    testDecodeReserved();
    return 0;
}
