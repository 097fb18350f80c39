#include "container.h"
#include "tagger.h"

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace
{

struct options_t
{
    fs::path out_dir;
    bool force{false};
    bool verbose{false};
    bool tag{true};
    std::vector<fs::path> inputs;
};

void print_help(char const* const argv0)
{
    std::cout << "Usage: " << fs::path{argv0}.stem() << " [-o dir] [-f] [-v] [--no-tag] file_1 [file_2 ... file_n]\n"
              << "  -o dir    write decoded files into dir instead of next to the input\n"
              << "  -f        overwrite existing output files\n"
              << "  -v        print the metadata of every file\n"
              << "  --no-tag  do not write title/album/artist/cover tags" << std::endl;
}

bool parse_args(int argc, char const* const argv[], options_t& opts)
{
    for(auto i = 1; i < argc; ++i) // skip argv[0]
    {
        std::string arg{argv[i]};
        if(arg == "-o")
        {
            if(++i >= argc)
                return false;
            opts.out_dir = argv[i];
        }
        else if(arg == "-f")
            opts.force = true;
        else if(arg == "-v")
            opts.verbose = true;
        else if(arg == "--no-tag")
            opts.tag = false;
        else if(arg == "-h" || arg == "--help")
            return false;
        else
            opts.inputs.emplace_back(arg);
    }

    return !opts.inputs.empty();
}

void print_info(const std::string& msg_prefix, const ncmunpack::music_info& info)
{
    std::cout << msg_prefix << "title: " << info.name << " (" << info.id << ")\n"
              << msg_prefix << "album: " << info.album << '\n';
    for(const auto& ar : info.artists)
        std::cout << msg_prefix << "artist: " << ar.name << " (" << ar.id << ")\n";
    std::cout << msg_prefix << "format: " << info.format << ", bitrate: " << info.bitrate
              << ", duration: " << info.duration << " ms" << std::endl;
}

// Returns true on success; every failure is reported on std::cerr.
bool convert(const fs::path& in_path, const options_t& opts)
{
    auto msg_prefix{(std::string{"[file: "} += in_path.string()) += "] "};
    if(!fs::exists(in_path))
    {
        std::cerr << msg_prefix << "not exists" << std::endl;
        return false;
    }

    std::ifstream in{in_path, std::ios::binary};
    if(!in.good())
    {
        std::cerr << msg_prefix << "cannot open" << std::endl;
        return false;
    }

    fs::path out_path;
    try
    {
        ncmunpack::container cracker{std::move(in)};
        auto info = cracker.info();
        if(opts.verbose)
            print_info(msg_prefix, info);

        out_path = opts.out_dir.empty() ? in_path : opts.out_dir / in_path.filename();
        out_path.replace_extension(std::string{"."} += info.format);
        if(fs::exists(out_path) && !opts.force)
        {
            std::cerr << msg_prefix << "dumpfile already exists" << std::endl;
            return false;
        }

        std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
        if(!out.good())
        {
            std::cerr << msg_prefix << "cannot create dumpfile" << std::endl;
            return false;
        }

        cracker.dump(out);
        out.close();

        if(opts.tag && !ncmunpack::write_tag(info, cracker.image(), out_path))
        {
            std::cerr << msg_prefix << "cannot write metadata" << std::endl;
            std::error_code ec;
            if(!fs::remove(out_path, ec))
                std::cerr << msg_prefix << "cannot clean temp" << std::endl;
            return false;
        }
    }
    catch(const std::exception& e)
    {
        std::cerr << msg_prefix << e.what() << std::endl;
        std::error_code ec;
        if(!out_path.empty() && fs::exists(out_path, ec) && !fs::remove(out_path, ec))
            std::cerr << msg_prefix << "cannot clean temp" << std::endl;
        return false;
    }

    std::cout << "Success: " << in_path << " -> " << out_path << std::endl;
    return true;
}

} // namespace

int main(int argc, char const* const argv[])
{
    options_t opts;
    if(!parse_args(argc, argv, opts))
    {
        print_help(argv[0]);
        return 255;
    }

    if(!opts.out_dir.empty() && !fs::is_directory(opts.out_dir))
    {
        std::cerr << "[dir: " << opts.out_dir.string() << "] not a directory" << std::endl;
        return 255;
    }

    int success_count{0}, failure_count{0};
    for(const auto& in_path : opts.inputs)
    {
        if(convert(in_path, opts))
            ++success_count;
        else
            ++failure_count;
    }

    int total = static_cast<int>(opts.inputs.size());
    std::cout << "\nTotal: " << total << "\tSuccess: " << success_count << "\tFailure: " << failure_count << std::endl;

    if(success_count == total)
        return 0;
    else if(failure_count == total)
    {
        std::cerr << "All failed" << std::endl;
        return 2;
    }
    else
        return 1;
}
