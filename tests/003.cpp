#include "utils.hpp"

namespace runlet::test {
    using namespace std::string_view_literals;

    TEST_CASE("003: sources without markers are modules", "[003][classifier]") {
        CHECK(classify_source("console.log(1 + 1)"sv) == source_kind::module);
        CHECK(classify_source("import fs from 'node:fs';\nconsole.log(fs.existsSync('.'))"sv) == source_kind::module);
        CHECK(classify_source("export const x = 1;"sv) == source_kind::module);
        CHECK(classify_source(""sv) == source_kind::module);
    }

    TEST_CASE("003: each marker selects commonjs", "[003][classifier]") {
        CHECK(classify_source("const fs = require('fs');"sv) == source_kind::commonjs);
        CHECK(classify_source("module.exports = { a: 1 };"sv) == source_kind::commonjs);
        CHECK(classify_source("console.log(__dirname)"sv) == source_kind::commonjs);
        CHECK(classify_source("console.log(__filename)"sv) == source_kind::commonjs);
        CHECK(classify_source("exports.answer = 42;"sv) == source_kind::commonjs);
    }

    TEST_CASE("003: markers match anywhere in the text", "[003][classifier]") {
        // comments and string literals are not skipped
        CHECK(classify_source("// no require( here\nconsole.log(1)"sv) == source_kind::commonjs);
        CHECK(classify_source("console.log('__dirname')"sv) == source_kind::commonjs);

        // near misses stay modules
        CHECK(classify_source("const required = 1; console.log(required)"sv) == source_kind::module);
        CHECK(classify_source("const dirname = import.meta.dirname;"sv) == source_kind::module);
    }

}  // namespace runlet::test
