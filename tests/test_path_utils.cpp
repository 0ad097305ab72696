#include "../src/path_utils.hpp"
#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

using namespace s3xfer;

void test_find_bucket_key() {
    auto [bucket, key] = find_bucket_key("mybucket/some/key.txt");
    assert(bucket == "mybucket");
    assert(key == "some/key.txt");

    auto [scheme_bucket, scheme_key] = find_bucket_key("s3://mybucket/prefix/");
    assert(scheme_bucket == "mybucket");
    assert(scheme_key == "prefix/");

    auto [bare_bucket, bare_key] = find_bucket_key("mybucket");
    assert(bare_bucket == "mybucket");
    assert(bare_key.empty());

    std::cout << "test_find_bucket_key: PASS\n";
}

void test_find_bucket_key_unicode() {
    auto [bucket, key] = find_bucket_key("\xE1\x88\xB4/\xE5\x99\xB8");  // U+1234 / U+5678
    assert(bucket == "\xE1\x88\xB4");
    assert(key == "\xE5\x99\xB8");
    std::cout << "test_find_bucket_key_unicode: PASS\n";
}

void test_relpath_normal() {
    std::string sep(1, std::filesystem::path::preferred_separator);
    assert(relative_path("/tmp/foo/bar", "/tmp/foo") == "." + sep + "bar");
    assert(relative_path("/tmp/foo/baz/bar", "/tmp/foo") == "baz" + sep + "bar");
    assert(relative_path("/tmp/other/bar", "/tmp/foo") == ".." + sep + "other" + sep + "bar");
    std::cout << "test_relpath_normal: PASS\n";
}

void test_url_unquote() {
    assert(url_unquote("plain.txt") == "plain.txt");
    assert(url_unquote("bar%0D.txt") == "bar\r.txt");
    assert(url_unquote("a%20b%2Fc") == "a b/c");
    assert(url_unquote("%e2%9c%93") == "\xE2\x9C\x93");
    std::cout << "test_url_unquote: PASS\n";
}

void test_url_unquote_malformed() {
    // Bad escapes are left alone
    assert(url_unquote("100%") == "100%");
    assert(url_unquote("%zz") == "%zz");
    assert(url_unquote("%4") == "%4");
    // A plus is not a space in keys
    assert(url_unquote("a+b") == "a+b");
    std::cout << "test_url_unquote_malformed: PASS\n";
}

void test_invalid_utf8_replaced() {
    const std::string replacement = "\xEF\xBF\xBD";

    // Lone continuation byte
    assert(url_unquote("a%9Cb") == "a" + replacement + "b");
    // Truncated three-byte sequence
    assert(url_unquote("%E2%9C") == replacement);
    // Overlong encoding of '/'
    assert(url_unquote("%C0%AF") == replacement + replacement);
    // Four-byte sequence is fine
    assert(url_unquote("%F0%9F%98%80") == "\xF0\x9F\x98\x80");
    std::cout << "test_invalid_utf8_replaced: PASS\n";
}

int main() {
    test_find_bucket_key();
    test_find_bucket_key_unicode();
    test_relpath_normal();
    test_url_unquote();
    test_url_unquote_malformed();
    test_invalid_utf8_replaced();
    std::cout << "All path utils tests passed!\n";
    return 0;
}
