#include "commands.hpp"
#include "bytes.hpp"
#include "disc_image.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <argparse.hpp>

using namespace gcdisc;

static void describe(const DiscImage& image, std::ostream& log)
{
    log << "Opened " << image.layout().gameCode << " (" << image.layout().gameName << ")\n";
    for (const auto& region : image.layout().privilegedRegions()) {
        log << "  " << region.path << ": " << bytes::hex(region.offset) << "+" << bytes::hex(region.size) << "\n";
    }
    log << "  " << image.files().size() << " files, " << image.files().numFstEntries() << " FST entries\n";
}

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("gcdisc", "0.1.0", argparse::default_arguments::all);
    program.add_description("Inspect and patch the file system of GameCube disc images.");

    program.add_argument("-v", "--verbose")
        .help("Print the decoded disc layout to stderr before running the command")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser isoinfo("isoinfo");
    isoinfo.add_description("Print the disc header and apploader fields");
    isoinfo.add_argument("isofile").help("The .iso file");

    argparse::ArgumentParser ls("ls");
    ls.add_description("List the files in a directory of the image");
    ls.add_argument("isofile").help("The .iso file to list internal files of");
    ls.add_argument("dir")
        .help("The internal directory to list")
        .nargs(argparse::nargs_pattern::optional)
        .default_value(std::string("/"));
    ls.add_argument("--cols")
        .help("The number of columns to list the files in")
        .scan<'i', int>();
    ls.add_argument("--size")
        .help("Additionally display the file size")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser read("read");
    read.add_description("Copy an internal file to a host file");
    read.add_argument("isofile").help("The .iso file");
    read.add_argument("internalfile").help("The path of the file inside the image to read from");
    read.add_argument("dstfile").help("The file to write the data to");
    read.add_argument("--offset")
        .help("Offset inside the internal file to start reading from")
        .default_value(std::string("0"));
    read.add_argument("--length").help("Number of bytes to read (default: until end of file)");

    argparse::ArgumentParser write("write");
    write.add_description("Overwrite (part of) an internal file with the contents of a host file");
    write.add_argument("isofile").help("The .iso file");
    write.add_argument("internalfile").help("The path of the file inside the image to write to");
    write.add_argument("srcfile").help("The file with the data to be written");
    write.add_argument("--offset")
        .help("Offset inside the internal file to write to")
        .default_value(std::string("0"));

    argparse::ArgumentParser dolinfo("dolinfo");
    dolinfo.add_description("Print the section table of a DOL executable");
    dolinfo.add_argument("file").help("An .iso file containing the DOL, or a .dol file");
    dolinfo.add_argument("internalfile")
        .help("The DOL inside the image (only used for .iso files)")
        .nargs(argparse::nargs_pattern::optional)
        .default_value(std::string(layout::EXECUTABLE_FILE));
    dolinfo.add_argument("--order")
        .help("Section order: header order (file), by DOL offset (dol) or by memory address (mem)")
        .default_value(std::string("file"))
        .choices("file", "dol", "mem");

    program.add_subparser(isoinfo);
    program.add_subparser(ls);
    program.add_subparser(read);
    program.add_subparser(write);
    program.add_subparser(dolinfo);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    const bool verbose = program.get<bool>("--verbose");

    try {
        if (program.is_subcommand_used(isoinfo)) {
            DiscImage image(isoinfo.get<std::string>("isofile"), true);
            if (verbose) describe(image, std::cerr);
            commands::printIsoInfo(image, std::cout);
        } else if (program.is_subcommand_used(ls)) {
            DiscImage image(ls.get<std::string>("isofile"), true);
            if (verbose) describe(image, std::cerr);
            const auto columns = commands::columnCount(ls.present<int>("--cols"));
            commands::printListing(image, ls.get<std::string>("dir"), columns, ls.get<bool>("--size"), std::cout);
        } else if (program.is_subcommand_used(read)) {
            DiscImage image(read.get<std::string>("isofile"), true);
            if (verbose) describe(image, std::cerr);
            std::optional<int64_t> length;
            if (auto text = read.present<std::string>("--length")) {
                length = commands::parseNumber(*text);
            }
            const auto destination = read.get<std::string>("dstfile");
            const size_t count = commands::extractFile(image, read.get<std::string>("internalfile"), destination,
                                                       commands::parseNumber(read.get<std::string>("--offset")),
                                                       length);
            std::cout << "Read " << count << " bytes into " << destination << "\n";
        } else if (program.is_subcommand_used(write)) {
            DiscImage image(write.get<std::string>("isofile"));
            if (verbose) describe(image, std::cerr);
            const auto internal = write.get<std::string>("internalfile");
            const size_t count = commands::patchFile(image, internal, write.get<std::string>("srcfile"),
                                                     commands::parseNumber(write.get<std::string>("--offset")));
            std::cout << "Wrote " << count << " bytes to " << internal << "\n";
        } else if (program.is_subcommand_used(dolinfo)) {
            auto executable = commands::loadExecutable(dolinfo.get<std::string>("file"),
                                                       dolinfo.get<std::string>("internalfile"));
            commands::printExecutableInfo(executable,
                                          commands::parseSectionOrder(dolinfo.get<std::string>("--order")),
                                          std::cout);
        } else {
            std::cerr << program;
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
