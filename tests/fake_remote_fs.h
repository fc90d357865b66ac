// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FAKE_REMOTE_FS_H_3306195827746120
#define FAKE_REMOTE_FS_H_3306195827746120

#include <algorithm>
#include <optional>
#include <string>
#include <vector>
#include <base/string_tools.h>


namespace ferry::test
{
//in-memory server file system: paths are '/'-separated without leading slash, "" is the root
//items keep creation order which plays the role of "server order"
class FakeRemoteFs
{
public:
    bool exists  (const std::string& path) const { return path.empty() || find(path) != items_.end(); }
    bool isFolder(const std::string& path) const { return path.empty() || (find(path) != items_.end() && !find(path)->content); }
    bool isFile  (const std::string& path) const { return find(path) != items_.end() && find(path)->content.has_value(); }

    const std::string& getContent(const std::string& path) const { return *find(path)->content; }

    std::vector<std::string> listFolder(const std::string& path) const
    {
        std::vector<std::string> names;
        for (const Item& item : items_)
            if (getParent(item.path) == path)
                names.push_back(afterLast(item.path, '/', IfNotFoundReturn::all));
        return names;
    }

    //parent folder must exist; overwrites existing files
    bool writeFile(const std::string& path, const std::string& content)
    {
        if (!isFolder(getParent(path)) || isFolder(path))
            return false;
        if (auto it = find(path); it != items_.end())
            it->content = content;
        else
            items_.push_back({path, content});
        return true;
    }

    bool makeFolder(const std::string& path)
    {
        if (path.empty() || exists(path) || !isFolder(getParent(path)))
            return false;
        items_.push_back({path, std::nullopt});
        return true;
    }

    bool removeFile(const std::string& path)
    {
        if (!isFile(path))
            return false;
        items_.erase(find(path));
        return true;
    }

    bool removeFolder(const std::string& path) //must be empty
    {
        if (path.empty() || !isFolder(path) || !listFolder(path).empty())
            return false;
        items_.erase(find(path));
        return true;
    }

    bool rename(const std::string& pathFrom, const std::string& pathTo) //files only; overwrites target file
    {
        if (!isFile(pathFrom) || isFolder(pathTo) || !isFolder(getParent(pathTo)))
            return false;
        if (pathFrom == pathTo)
            return true;
        removeFile(pathTo);
        find(pathFrom)->path = pathTo;
        return true;
    }

    static std::string getParent(const std::string& path) { return beforeLast(path, '/', IfNotFoundReturn::none); }

    static std::string appendPath(const std::string& folderPath, const std::string& name)
    {
        return folderPath.empty() ? name : folderPath + '/' + name;
    }

private:
    struct Item
    {
        std::string path;
        std::optional<std::string> content; //no value: folder
    };

    std::vector<Item>::iterator find(const std::string& path)
    {
        return std::find_if(items_.begin(), items_.end(), [&](const Item& item) { return item.path == path; });
    }
    std::vector<Item>::const_iterator find(const std::string& path) const
    {
        return std::find_if(items_.begin(), items_.end(), [&](const Item& item) { return item.path == path; });
    }

    std::vector<Item> items_;
};
}

#endif //FAKE_REMOTE_FS_H_3306195827746120
