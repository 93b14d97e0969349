#ifndef PARENT_LOCATOR_HPP
#define PARENT_LOCATOR_HPP
#include <memory>
#include <string>
#include <vector>
#include "checksum.hpp"

class Byte_Source;
class CHD_File;
struct CHD_Header;
struct CHD_Options;
class Hunk_Map;

//Supplied by the application: finds the image a child names as its parent
class Parent_Locator
{
    public:
        virtual ~Parent_Locator() {}

        //Source for the image whose header SHA-1 is sha1, or null if there isn't one
        virtual std::unique_ptr<Byte_Source> open_parent(const SHA1_Digest& sha1) = 0;
};

//Looks through a list of files (and *.chd files in directories) for a matching header SHA-1
class Path_Parent_Locator : public Parent_Locator
{
    public:
        Path_Parent_Locator() {}
        Path_Parent_Locator(std::vector<std::string> paths);

        void add_path(const std::string& path);
        void add_directory(const std::string& directory);
        const std::vector<std::string>& paths() const { return m_paths; }

        std::unique_ptr<Byte_Source> open_parent(const SHA1_Digest& sha1) override;
    private:
        std::vector<std::string> m_paths;
};

class Parent_Resolver
{
    public:
        Parent_Resolver(Parent_Locator* locator, const CHD_Options& options);

        /*
        Opens the parent the header asks for, along with the rest of its chain.
        chain holds the identities of every image from the one being opened down to the
        original child. Returns null when the header has no parent.
        */
        std::unique_ptr<CHD_File> resolve(const CHD_Header& header, const Hunk_Map& map,
                                          std::vector<SHA1_Digest>& chain);
    private:
        Parent_Locator* m_locator;
        const CHD_Options& m_options;
};

#endif // PARENT_LOCATOR_HPP
