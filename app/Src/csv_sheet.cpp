// app/Src/csv_sheet.cpp
#include "csv_sheet.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace vfd_app {

std::vector<std::string> split_csv_line(const std::string& line, char sep){
    std::vector<std::string> out;
    std::string field;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i){
        const char c = line[i];
        if (quoted){
            if (c == '"'){
                if (i + 1 < line.size() && line[i + 1] == '"') {field += '"'; ++i;}     //escaped quote
                else quoted = false;
            } else {
                field += c;
            }
        } else if (c == '"'){
            quoted = true;
        } else if (c == sep){
            out.push_back(field);
            field.clear();
        } else if (c != '\r'){
            field += c;
        }
    }
    out.push_back(field);
    return out;
}

bool load_csv_sheet(const std::string& path, vfd::RawSheet& out, std::string& err){
    std::ifstream in(path);
    if (!in){
        err = "cannot open " + path;
        return false;
    }

    out = vfd::RawSheet{};
    out.name = fs::path(path).stem().string();

    std::string line;
    if (!std::getline(in, line)){
        err = "empty file";
        return false;
    }
    //strip a UTF-8 BOM some spreadsheet exports put in front
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
    out.columns = split_csv_line(line);

    while (std::getline(in, line)){
        if (line.empty() || line == "\r") continue;
        std::vector<std::string> fields = split_csv_line(line);

        vfd::RawRecord row;
        row.reserve(out.columns.size());
        for (size_t c = 0; c < out.columns.size(); ++c){
            if (c >= fields.size() || fields[c].empty()) row.push_back(vfd::Cell::null());
            else                                         row.push_back(vfd::Cell::str(fields[c]));
        }
        out.rows.push_back(std::move(row));
    }
    return true;
}

std::vector<std::string> collect_sheet_paths(const std::vector<std::string>& args){
    std::vector<std::string> out;
    for (const std::string& a : args){
        std::error_code ec;
        if (fs::is_directory(a, ec)){
            std::vector<std::string> found;
            for (const fs::directory_entry& e : fs::directory_iterator(a, ec)){
                if (e.is_regular_file(ec) && e.path().extension() == ".csv")
                    found.push_back(e.path().string());
            }
            std::sort(found.begin(), found.end());
            out.insert(out.end(), found.begin(), found.end());
        } else {
            out.push_back(a);       //missing files are reported when loading
        }
    }
    return out;
}

} // namespace vfd_app
