#include "parent_locator.hpp"
#include "byte_source.hpp"
#include "chd_file.hpp"
#include "chd_header.hpp"
#include "chd_options.hpp"
#include "codec.hpp"
#include "hunk_map.hpp"
#include "../errors.hpp"
#include "../logger.hpp"

#include <algorithm>
#include <cctype>
#include <dirent.h>

Path_Parent_Locator::Path_Parent_Locator(std::vector<std::string> paths) : m_paths(std::move(paths))
{

}

void Path_Parent_Locator::add_path(const std::string& path)
{
    m_paths.push_back(path);
}

static bool has_chd_extension(const std::string& name)
{
    if (name.size() < 4)
        return false;
    std::string ext = name.substr(name.size() - 4);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)tolower(c); });
    return ext == ".chd";
}

void Path_Parent_Locator::add_directory(const std::string& directory)
{
    DIR* dir = opendir(directory.c_str());
    if (!dir)
    {
        Errors::print_warning("can't search %s for parent images", directory.c_str());
        return;
    }

    std::vector<std::string> found;
    while (struct dirent* ent = readdir(dir))
    {
        std::string name = ent->d_name;
        if (has_chd_extension(name))
            found.push_back(directory + "/" + name);
    }
    closedir(dir);

    std::sort(found.begin(), found.end());
    m_paths.insert(m_paths.end(), found.begin(), found.end());
}

std::unique_ptr<Byte_Source> Path_Parent_Locator::open_parent(const SHA1_Digest& sha1)
{
    for (const std::string& path : m_paths)
    {
        try
        {
            std::unique_ptr<File_Source> source(new File_Source(path));
            CHD_Header header = CHD_Header::parse(*source, Codec_Registry::defaults());
            if (header.sha1 == sha1)
            {
                dh_log->parent->info("found parent {} at {}", sha1_to_string(sha1), path);
                return std::move(source);
            }
        }
        catch (CHD_Error& e)
        {
            Errors::print_warning("skipping parent candidate %s: %s", path.c_str(), e.what());
        }
    }
    return nullptr;
}

Parent_Resolver::Parent_Resolver(Parent_Locator* locator, const CHD_Options& options) :
    m_locator(locator), m_options(options)
{

}

std::unique_ptr<CHD_File> Parent_Resolver::resolve(const CHD_Header& header, const Hunk_Map& map,
                                                   std::vector<SHA1_Digest>& chain)
{
    if (!header.has_parent())
        return nullptr;

    std::string wanted = sha1_to_string(header.parent_sha1);
    if (std::find(chain.begin(), chain.end(), header.parent_sha1) != chain.end())
        Errors::raise<Parent_cycle_error>("parent %s is already part of this image's chain", wanted.c_str());
    if (chain.size() > m_options.max_parent_depth)
        Errors::raise<Parent_chain_too_deep_error>("parent chain is deeper than %u images", m_options.max_parent_depth);
    if (!m_locator)
        Errors::raise<Parent_not_found_error>("image needs parent %s, but nothing can locate parents", wanted.c_str());

    std::unique_ptr<Byte_Source> source = m_locator->open_parent(header.parent_sha1);
    if (!source)
        Errors::raise<Parent_not_found_error>("parent %s could not be found", wanted.c_str());

    dh_log->parent->debug("opening parent {} at depth {}", wanted, chain.size());
    std::unique_ptr<CHD_File> parent = CHD_File::open_chained(std::move(source), m_options, m_locator, chain);

    if (parent->sha1() != header.parent_sha1)
    {
        Errors::raise<Parent_not_found_error>("asked for parent %s but got %s",
                                              wanted.c_str(), sha1_to_string(parent->sha1()).c_str());
    }
    if (parent->unit_bytes() != header.unit_bytes)
    {
        Errors::raise<Index_corrupt_error>("parent units are %u bytes, the child's are %u",
                                           parent->unit_bytes(), header.unit_bytes);
    }

    uint64_t needed = map.parent_units_needed(header.hunk_bytes / header.unit_bytes) * header.unit_bytes;
    uint64_t available = (uint64_t)parent->hunk_count() * parent->hunk_bytes();
    if (needed > available)
    {
        Errors::raise<Index_corrupt_error>("child references %llu bytes of a %llu byte parent",
                                           (unsigned long long)needed, (unsigned long long)available);
    }
    return parent;
}
