#pragma once

#include "DataFrame.h"
#include "ScriptInterpreter.h"
#include "ScriptParser.h"
#include "SecurityPolicy.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <unistd.h>

namespace TabulaTest {

inline const Tabula::SecurityPolicy& defaultPolicy() {
    static const Tabula::SecurityPolicy policy = Tabula::SecurityPolicy::defaults();
    return policy;
}

// student | course_name | score | level
// Ana       Math          80.0    1
// Ben       Math          90.0    2
// Cy        Art           70.0    1
// Dee       Art           60.0    3
// Eve       Bio           85.5    2
inline Tabula::DataFrame scoresFrame() {
    Tabula::DataFrame df;
    df.columns.push_back(Tabula::Column::fromStrings("student", {"Ana", "Ben", "Cy", "Dee", "Eve"}));
    df.columns.push_back(Tabula::Column::fromStrings("course_name", {"Math", "Math", "Art", "Art", "Bio"}));
    df.columns.push_back(Tabula::Column::fromDoubles("score", {80.0, 90.0, 70.0, 60.0, 85.5}));
    df.columns.push_back(Tabula::Column::fromInts("level", {1, 2, 1, 3, 2}));
    df.index = Tabula::Index::range(5);
    return df;
}

// `n` rows with id = 0..n-1 and value = id * 1.5.
inline Tabula::DataFrame sequenceFrame(size_t n) {
    std::vector<int64_t> ids;
    std::vector<double> values;
    for (size_t i = 0; i < n; ++i) {
        ids.push_back(static_cast<int64_t>(i));
        values.push_back(static_cast<double>(i) * 1.5);
    }
    Tabula::DataFrame df;
    df.columns.push_back(Tabula::Column::fromInts("id", std::move(ids)));
    df.columns.push_back(Tabula::Column::fromDoubles("value", std::move(values)));
    df.index = Tabula::Index::range(n);
    return df;
}

inline Tabula::Value runScript(const std::string& code, Tabula::DataFrame df = scoresFrame()) {
    Tabula::ScriptInterpreter interp(defaultPolicy(), std::make_shared<Tabula::DataFrame>(std::move(df)));
    const Tabula::Ast::Module module = Tabula::ScriptParser::parse(code);
    return interp.run(module);
}

/**
 * @brief Writes `content` to a uniquely named file that is removed on destruction.
 */
class TempFile {
public:
    TempFile(const std::string& suffix, const std::string& content) {
        static int counter = 0;
        path_ = (std::filesystem::temp_directory_path() /
                 ("tabula_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + suffix))
                    .string();
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace TabulaTest
