#include <catch2/catch_test_macros.hpp>

#include "line_channel.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <unistd.h>

using json = nlohmann::json;

namespace {

struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() { REQUIRE(::pipe(fds) == 0); }

    ~Pipe() {
        close_read();
        close_write();
    }

    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }

    void close_read() {
        if (fds[0] >= 0) ::close(fds[0]);
        fds[0] = -1;
    }
    void close_write() {
        if (fds[1] >= 0) ::close(fds[1]);
        fds[1] = -1;
    }

    void put(const std::string& bytes) {
        REQUIRE(::write(fds[1], bytes.data(), bytes.size()) == static_cast<ssize_t>(bytes.size()));
    }
};

} // namespace

TEST_CASE("LineChannel", "[channel]") {

    SECTION("MessageRoundTrip") {
        Pipe p;
        LineChannel writer(-1, p.write_end());
        LineChannel reader(p.read_end(), -1);

        json msg = {{"type", "ready"}, {"pid", 1234}};
        REQUIRE(writer.write_message(msg));

        auto line = reader.read_line(1000);
        REQUIRE(line);
        REQUIRE(line->find('\n') == std::string::npos);
        REQUIRE(json::parse(*line) == msg);
    }

    SECTION("SeveralLinesInOneRead") {
        Pipe p;
        p.put("one\ntwo\r\nthree\n");
        LineChannel reader(p.read_end(), -1);

        REQUIRE(reader.read_line(1000) == "one");
        REQUIRE(reader.read_line(1000) == "two");
        REQUIRE(reader.read_line(1000) == "three");
    }

    SECTION("LineSplitAcrossWrites") {
        Pipe p;
        LineChannel reader(p.read_end(), -1);
        p.put("{\"id\":");
        p.put("1}\n");
        REQUIRE(reader.read_line(1000) == "{\"id\":1}");
    }

    SECTION("EmptyLinesAreReturned") {
        Pipe p;
        p.put("\n\nx\n");
        LineChannel reader(p.read_end(), -1);
        REQUIRE(reader.read_line(1000) == "");
        REQUIRE(reader.read_line(1000) == "");
        REQUIRE(reader.read_line(1000) == "x");
    }

    SECTION("TimeoutWithoutData") {
        Pipe p;
        LineChannel reader(p.read_end(), -1);
        REQUIRE_FALSE(reader.read_line(50));
        REQUIRE_FALSE(reader.eof());
    }

    SECTION("EndOfInput") {
        Pipe p;
        p.put("last line without newline");
        p.close_write();
        LineChannel reader(p.read_end(), -1);

        REQUIRE(reader.read_line() == "last line without newline");
        REQUIRE_FALSE(reader.read_line());
        REQUIRE(reader.eof());
    }

    SECTION("NonUtf8TextIsReplaced") {
        Pipe p;
        LineChannel writer(-1, p.write_end());
        LineChannel reader(p.read_end(), -1);

        REQUIRE(writer.write_message(json{{"text", std::string("bad \xFF byte")}}));
        auto line = reader.read_line(1000);
        REQUIRE(line);
        REQUIRE(json::parse(*line)["text"] == "bad \xEF\xBF\xBD byte");
    }
}
