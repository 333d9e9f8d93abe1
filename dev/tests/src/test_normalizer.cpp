#include "vfd/types.hpp"
#include "vfd/normalizer.hpp"
#include <cstdio>
#include <string>
#include <vector>

using namespace vfd;

//purpose of this test file is to check column matching, axial relabel, null/bad time dropping and sorting
//g++ -std=c++17 -I lib/core/include dev/tests/src/test_normalizer.cpp \
  lib/core/src/normalizer.cpp lib/core/src/timestamp.cpp -o /tmp/test_normalizer && /tmp/test_normalizer

static int g_fail = 0;

static void test_bool(const char* name, bool got, bool want){
    if (got != want) {std::printf("[FAIL] %s: got=%d want=%d\n", name, got, want); g_fail++;}
    else             std::printf("[PASS] %s: got=%d want=%d\n", name, got, want);
}
static void test_size(const char* name, size_t got, size_t want){
    if (got != want) {std::printf("[FAIL] %s: got=%zu want=%zu\n", name, got, want); g_fail++;}
    else             std::printf("[PASS] %s: got=%zu\n", name, got);
}
static void test_near(const char* name, double got, double want, double eps=1e-9){
    double err = got > want ? got - want : want - got;
    if (err > eps) {std::printf("[FAIL] %s: got=%.6f want=%.6f\n", name, got, want); g_fail++;}
    else           std::printf("[PASS] %s: got=%.6f want=%.6f\n", name, got, want);
}

// one per-axis row, times are epoch seconds as text
static RawRecord row6(const char* tx, const char* x, const char* ty, const char* y, const char* tz, const char* z){
    auto c = [](const char* s){ return s ? Cell::str(s) : Cell::null(); };
    return {c(tx), c(x), c(ty), c(y), c(tz), c(z)};
}

int main() {

    // test 1 upper case headers still match, rows come back sorted
    RawSheet sheet{};
    sheet.name = "pump-1";
    sheet.columns = {"T(X)", "X", "t(Y)", "y", "T(z)", "Z"};
    sheet.rows.push_back(row6("3", "0.3", "3", "1.3", "30", "2.3"));
    sheet.rows.push_back(row6("1", "0.1", "1", "1.1", "10", "2.1"));
    sheet.rows.push_back(row6("2", "0.2", "2", "1.2", "20", "2.2"));

    AxisNormalizer norm_z(NormalizeConfig{});
    NormalizeResult r1 = norm_z.normalize(sheet);
    test_bool("case-insensitive ok", r1.ok(), true);
    test_size("all rows kept", r1.samples.size(), 3);
    if (r1.samples.size() == 3){
        //axial z: time comes from t(z)
        test_bool("sorted by t(z)", r1.samples[0].t_us == 10 * kUsPerSecond && r1.samples[2].t_us == 30 * kUsPerSecond, true);
        test_near("z is raw z", r1.samples[0].z, 2.1);
        test_near("x is raw x", r1.samples[0].x, 0.1);
        test_near("y is raw y", r1.samples[0].y, 1.1);
    }

    // test 2 axial x: raw x lands in z, radials keep order (y -> x, z -> y)
    NormalizeConfig cx{};
    cx.axial = AxisId::X;
    NormalizeResult r2 = AxisNormalizer(cx).normalize(sheet);
    if (r2.samples.size() == 3){
        test_near("axial x -> z", r2.samples[0].z, 0.1);
        test_near("raw y -> x", r2.samples[0].x, 1.1);
        test_near("raw z -> y", r2.samples[0].y, 2.1);
        test_bool("time from t(x)", r2.samples[0].t_us == 1 * kUsPerSecond, true);
    } else {
        test_size("axial x rows", r2.samples.size(), 3);
    }

    // test 3 axial y
    NormalizeConfig cy{};
    cy.axial = AxisId::Y;
    NormalizeResult r3 = AxisNormalizer(cy).normalize(sheet);
    if (r3.samples.size() == 3){
        test_near("axial y -> z", r3.samples[0].z, 1.1);
        test_near("raw x stays x", r3.samples[0].x, 0.1);
        test_near("raw z -> y", r3.samples[0].y, 2.1);
    }

    // test 4 missing columns are a result, not an exception
    RawSheet bad = sheet;
    bad.columns = {"t(x)", "x", "y", "t(z)", "z", "extra"};
    NormalizeResult r4 = norm_z.normalize(bad);
    test_bool("invalid schema", r4.status == NormalizeStatus::InvalidSchema, true);
    test_size("one missing column", r4.missing_columns.size(), 1);
    if (!r4.missing_columns.empty()) test_bool("missing is t(y)", r4.missing_columns[0] == "t(y)", true);
    test_size("no samples on invalid", r4.samples.size(), 0);

    // test 5 nulls and unparseable values are dropped, duplicates are kept
    RawSheet dirty{};
    dirty.columns = {"t(x)", "x", "t(y)", "y", "t(z)", "z"};
    dirty.rows.push_back(row6("1", "0.1", "1", "0.1", "5", "0.1"));
    dirty.rows.push_back(row6("2", nullptr, "2", "0.1", "6", "0.1"));    //null x
    dirty.rows.push_back(row6("3", "0.1", "3", "0.1", "later", "0.1"));  //bad axial time
    dirty.rows.push_back(row6("4", "0.1", "4", "abc", "7", "0.1"));      //bad number
    dirty.rows.push_back(row6("5", "0.2", "5", "0.2", "5", "0.2"));      //duplicate t
    dirty.rows.push_back(row6("6", "0.1", "6", "0.1", nullptr, "0.1"));  //null axial time
    dirty.rows.push_back({Cell::str("7"), Cell::str("0.1")});             //short row

    NormalizeResult r5 = norm_z.normalize(dirty);
    test_bool("dirty ok", r5.ok(), true);
    test_size("dirty kept", r5.samples.size(), 2);
    test_size("dropped null", r5.dropped_null, 4);
    test_size("dropped bad time", r5.dropped_bad_time, 1);
    if (r5.samples.size() == 2){
        test_bool("duplicate t kept", r5.samples[0].t_us == r5.samples[1].t_us, true);
        test_near("duplicates keep source order", r5.samples[1].x, 0.2);
    }

    // test 6 shared time column with its own name
    RawSheet shared{};
    shared.columns = {"Time", "x", "Y", "z"};
    shared.rows.push_back({Cell::str("2024-01-01 00:00:01"), Cell::number(1.0), Cell::number(2.0), Cell::number(3.0)});
    shared.rows.push_back({Cell::str("2024-01-01 00:00:00"), Cell::number(4.0), Cell::number(5.0), Cell::number(6.0)});
    NormalizeConfig cs{};
    cs.layout = SchemaLayout::SharedTime;
    cs.time_column = "time";
    NormalizeResult r6 = AxisNormalizer(cs).normalize(shared);
    test_bool("shared ok", r6.ok(), true);
    if (r6.samples.size() == 2){
        test_near("shared sorted", r6.samples[0].x, 4.0);
        test_near("shared z", r6.samples[0].z, 6.0);
    }
    cs.time_column = "timestamp";
    NormalizeResult r7 = AxisNormalizer(cs).normalize(shared);
    test_bool("shared wrong time column", r7.status == NormalizeStatus::InvalidSchema, true);

    return g_fail ? 1 : 0;
}
