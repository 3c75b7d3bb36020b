#include "robosave/naming.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "robosave/protocol.hpp"

namespace robosave
{

    namespace
    {

        bool is_safe_char(char ch)
        {
            const auto uch = static_cast<unsigned char>(ch);
            return (uch < 0x80 && std::isalnum(uch)) || ch == '_' || ch == '.' || ch == '-';
        }

    } // namespace

    std::string sanitize_base_name(std::string_view base_name)
    {
        std::string result(base_name);
        for (auto &ch : result)
        {
            if (!is_safe_char(ch))
            {
                ch = '_';
            }
        }
        return result;
    }

    std::filesystem::path output_path_for(const std::filesystem::path &dir, std::string_view sanitized_name)
    {
        std::string file_name(sanitized_name);
        file_name += '.';
        file_name += protocol::kOutputExtension;
        return dir / file_name;
    }

    std::filesystem::path debug_path_for(const std::filesystem::path &dir, std::string_view sanitized_name,
                                         std::chrono::system_clock::time_point when)
    {
        std::string file_name = "debug_";
        file_name += sanitized_name;
        file_name += '_';
        file_name += format_timestamp(when);
        file_name += ".log";
        return dir / file_name;
    }

    std::string format_timestamp(std::chrono::system_clock::time_point when)
    {
        const auto time = std::chrono::system_clock::to_time_t(when);
        std::tm local{};
        localtime_r(&time, &local);
        std::ostringstream oss;
        oss << std::put_time(&local, "%Y%m%d_%H%M%S");
        return oss.str();
    }

} // namespace robosave
