/**
 * @file test_io_stream.cc
 * @brief Unit tests for the file and memory byte streams
 */

#include <doctest/doctest.h>
#include <afqueue/sdk/io_stream.hh>

#include <cstdio>
#include <fstream>
#include <string>

using namespace afqueue;

TEST_SUITE("IoStream::Unit") {

    TEST_CASE("should_read_and_seek_memory") {
        const char data[] = "0123456789";
        auto stream = io_from_memory(data, 10);
        REQUIRE(stream);
        CHECK(stream->is_open());
        CHECK(stream->get_size() == 10);

        char buf[4] = {};
        CHECK(stream->read(buf, 4) == 4);
        CHECK(std::string(buf, 4) == "0123");
        CHECK(stream->tell() == 4);

        CHECK(stream->seek(-2, seek_origin::end) == 8);
        CHECK(stream->read(buf, 4) == 2);
        CHECK(std::string(buf, 2) == "89");

        CHECK(stream->seek(3, seek_origin::set) == 3);
        CHECK(stream->seek(2, seek_origin::cur) == 5);
        CHECK(stream->seek(11, seek_origin::set) < 0);
        CHECK(stream->tell() == 5);

        stream->close();
        CHECK_FALSE(stream->is_open());
        CHECK(stream->read(buf, 1) == 0);
    }

    TEST_CASE("should_report_missing_files_as_closed") {
        auto stream = io_from_file("/nonexistent/afqueue/input.wav");
        REQUIRE(stream);
        CHECK_FALSE(stream->is_open());
        CHECK(stream->get_size() < 0);
    }

    TEST_CASE("should_read_files_and_recover_from_eof") {
        const std::string path = "afqueue_io_stream_test.bin";
        {
            std::ofstream out(path, std::ios::binary);
            out << "abcdef";
        }

        {
            auto stream = io_from_file(path);
            REQUIRE(stream->is_open());
            CHECK(stream->get_size() == 6);

            char buf[16] = {};
            CHECK(stream->read(buf, sizeof(buf)) == 6);
            // Hitting the end must not poison later seeks
            CHECK(stream->seek(1, seek_origin::set) == 1);
            CHECK(stream->read(buf, 2) == 2);
            CHECK(std::string(buf, 2) == "bc");
        }
        std::remove(path.c_str());
    }
}
