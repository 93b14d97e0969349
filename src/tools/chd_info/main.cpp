#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>

#include <cstdio>
#include <memory>

#include "settings.hpp"
#include "../../core/cdvd/cdrom_image.hpp"
#include "../../core/chd/chd_file.hpp"
#include "../../core/chd/chd_verifier.hpp"
#include "../../core/chd/parent_locator.hpp"
#include "../../core/errors.hpp"
#include "../../core/logger.hpp"

static void print_header(const CHD_File& file)
{
    const CHD_Header& header = file.header();
    printf("Version:        %u\n", header.version);
    printf("Logical size:   %llu bytes\n", (unsigned long long)header.logical_bytes);
    printf("Hunk size:      %u bytes\n", header.hunk_bytes);
    printf("Unit size:      %u bytes\n", header.unit_bytes);
    printf("Total hunks:    %u\n", header.hunk_count);
    for (uint32_t i = 0; i < header.compressor_count; i++)
    {
        if (header.compressors[i] != CHD_CODEC_NONE)
            printf("Compression %u:  %s\n", i, file.codecs().name(header.compressors[i]).c_str());
    }
    printf("SHA-1:          %s\n", sha1_to_string(header.sha1).c_str());
    printf("Data SHA-1:     %s\n", sha1_to_string(header.raw_sha1).c_str());
    if (header.has_parent())
        printf("Parent SHA-1:   %s\n", sha1_to_string(header.parent_sha1).c_str());
}

static void print_hunk_usage(const CHD_File& file)
{
    uint32_t counts[5] = {0};
    const Hunk_Map& map = file.map();
    for (uint32_t hunk = 0; hunk < map.size(); hunk++)
        counts[(int)map[hunk].kind]++;

    printf("Hunks:          %u compressed, %u uncompressed, %u copies, %u from parent, %u inline\n",
           counts[(int)Hunk_Kind::Compressed], counts[(int)Hunk_Kind::Uncompressed],
           counts[(int)Hunk_Kind::Self_Copy], counts[(int)Hunk_Kind::Parent_Copy], counts[(int)Hunk_Kind::Mini]);
}

static void print_metadata(const CHD_File& file)
{
    for (const Metadata_Entry& entry : file.metadata().entries())
    {
        printf("Metadata:       '%s' %zu bytes%s\n", tag_to_string(entry.tag).c_str(), entry.data.size(),
               (entry.flags & CHD_MDFLAGS_CHECKSUM) ? " (checksummed)" : "");
        bool printable = true;
        for (uint8_t c : entry.data)
        {
            if (c != 0 && (c < 0x20 || c >= 0x7F))
                printable = false;
        }
        if (printable)
            printf("                %s\n", entry.text().c_str());
    }
}

static void print_tracks(CHD_File& file)
{
    CDROM_Image image(file);
    std::vector<SHA1_Digest> digests = image.track_sha1s();
    for (size_t i = 0; i < image.tracks().size(); i++)
    {
        const CD_Track& track = image.tracks()[i];
        printf("Track %02u:       %-14s %6u frames at LBA %-7u %s\n", track.number, track.type_name.c_str(),
               track.frames, track.start_lba, sha1_to_string(digests[i]).c_str());
    }
}

int main(int argc, char** argv)
{
    QCoreApplication::setOrganizationName("DiscHunk");
    QCoreApplication::setApplicationName("chd_info");

    QCoreApplication a(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription("Prints what's inside a CHD image and optionally verifies it");
    parser.addHelpOption();
    parser.addPositionalArgument("image", "CHD file to inspect");

    QCommandLineOption parent_option({"p", "parent-dir"}, "Search {dir} for parent images", "dir");
    QCommandLineOption verify_option({"v", "verify"}, "Decode every hunk and check the image's SHA-1");
    QCommandLineOption tracks_option({"t", "tracks"}, "List CD tracks with their SHA-1");
    QCommandLineOption metadata_option({"m", "metadata"}, "List metadata entries");
    QCommandLineOption cache_option({"c", "cache"}, "Keep {hunks} decoded hunks in memory", "hunks");
    QCommandLineOption log_option({"l", "log"}, "Also write a full log to {file}", "file");
    QCommandLineOption debug_option("debug", "Print debug messages on the console");
    QCommandLineOption save_option("save", "Remember parent directories, cache size and log file");
    parser.addOptions({parent_option, verify_option, tracks_option, metadata_option,
                       cache_option, log_option, debug_option, save_option});
    parser.process(a);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1)
        parser.showHelp(1);

    Settings& settings = Settings::instance();
    for (const QString& dir : parser.values(parent_option))
        settings.add_parent_directory(QFileInfo(dir).absoluteFilePath());
    if (parser.isSet(cache_option))
        settings.cache_hunks = parser.value(cache_option).toInt();
    if (parser.isSet(log_option))
        settings.log_path = parser.value(log_option);
    if (parser.isSet(save_option))
        settings.save();

    if (parser.isSet(debug_option))
        dh_log->set_console_level(spdlog::level::debug);
    if (!settings.log_path.isEmpty())
        dh_log->add_file_sink(settings.log_path.toStdString());

    QString image_path = args.front();
    Path_Parent_Locator locator;
    locator.add_directory(QFileInfo(image_path).absolutePath().toStdString());
    for (const QString& dir : settings.parent_directories)
        locator.add_directory(dir.toStdString());

    CHD_Options options;
    options.cache_hunks = settings.cache_hunks > 0 ? settings.cache_hunks : 0;
    options.max_parent_depth = settings.max_parent_depth;
    options.verify_hunks = settings.verify_hunks;
    options.multithreaded = false;

    try
    {
        std::unique_ptr<CHD_File> file = CHD_File::open(image_path.toStdString(), options, &locator);
        printf("Input file:     %s\n", image_path.toLocal8Bit().constData());
        print_header(*file);
        print_hunk_usage(*file);

        if (parser.isSet(metadata_option))
            print_metadata(*file);
        if (parser.isSet(tracks_option))
            print_tracks(*file);

        if (parser.isSet(verify_option))
        {
            printf("Verifying...\n");
            CHD_Verifier::verify_image(*file);
            printf("Verification successful\n");
        }
    }
    catch (Integrity_error& e)
    {
        fprintf(stderr, "Verification failed: %s\n", e.what());
        for (uint32_t hunk : e.hunks())
            fprintf(stderr, "  bad hunk %u\n", hunk);
        return 2;
    }
    catch (CHD_Error& e)
    {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
