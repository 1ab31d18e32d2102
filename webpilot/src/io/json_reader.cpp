#include "io/json_reader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace webpilot::io
{

    nlohmann::json loadJsonFile(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + path.string());
        }

        nlohmann::json data;
        in >> data;
        if (!data.is_object())
        {
            throw std::runtime_error("JSON root is not object: " + path.string());
        }
        return data;
    }

    std::vector<nlohmann::json> parseJsonLines(const std::string &text)
    {
        std::vector<nlohmann::json> out;
        std::istringstream input(text);
        std::string line;
        while (std::getline(input, line))
        {
            if (line.empty() || line[0] != '{')
            {
                continue;
            }
            nlohmann::json item = nlohmann::json::parse(line, nullptr, false);
            if (!item.is_discarded())
            {
                out.push_back(std::move(item));
            }
        }
        return out;
    }

    std::vector<std::string> splitFlags(const std::string &text)
    {
        std::vector<std::string> out;
        std::istringstream input(text);
        std::string token;
        while (input >> token)
        {
            if (!token.empty())
            {
                out.push_back(token);
            }
        }
        return out;
    }

} // namespace webpilot::io
