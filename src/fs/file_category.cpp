#include "../pchheader.hpp"
#include "../util/util.hpp"
#include "file_category.hpp"

namespace fs
{
    const std::unordered_map<std::string, FILE_CATEGORY> EXTENSION_CATEGORIES = {
        {".jpg", IMAGE}, {".jpeg", IMAGE}, {".png", IMAGE}, {".gif", IMAGE}, {".bmp", IMAGE}, {".tiff", IMAGE}, {".webp", IMAGE},
        {".pdf", PDF},
        {".doc", WORD}, {".docx", WORD},
        {".xls", EXCEL}, {".xlsx", EXCEL}, {".csv", EXCEL}, {".ods", EXCEL},
        {".ppt", POWERPOINT}, {".pptx", POWERPOINT}, {".odp", POWERPOINT},
        {".mp4", VIDEO}, {".avi", VIDEO}, {".mkv", VIDEO}, {".mov", VIDEO}, {".wmv", VIDEO}, {".flv", VIDEO}, {".webm", VIDEO},
        {".mp3", AUDIO}, {".wav", AUDIO}, {".flac", AUDIO}, {".aac", AUDIO}, {".ogg", AUDIO},
        {".zip", ARCHIVE}, {".rar", ARCHIVE}, {".7z", ARCHIVE}, {".tar", ARCHIVE}, {".gz", ARCHIVE},
        {".py", CODE}, {".js", CODE}, {".html", CODE}, {".css", CODE}, {".json", CODE}, {".xml", CODE}, {".sql", CODE},
        {".java", CODE}, {".cpp", CODE}, {".c", CODE}, {".h", CODE}, {".hpp", CODE},
        {".txt", TEXT}, {".rtf", TEXT}, {".odt", TEXT}, {".md", TEXT}, {".log", TEXT}};

    /**
     * Maps an entry to its icon category by lower cased extension.
     */
    FILE_CATEGORY get_file_category(std::string_view name, const bool is_dir)
    {
        if (is_dir)
            return FOLDER;

        const auto itr = EXTENSION_CATEGORIES.find(util::to_lower(util::fetch_file_extension(name)));
        return itr == EXTENSION_CATEGORIES.end() ? FILE : itr->second;
    }

    const char *category_name(const FILE_CATEGORY category)
    {
        switch (category)
        {
        case FOLDER:
            return "folder";
        case IMAGE:
            return "image";
        case PDF:
            return "pdf";
        case WORD:
            return "word";
        case EXCEL:
            return "excel";
        case POWERPOINT:
            return "powerpoint";
        case VIDEO:
            return "video";
        case AUDIO:
            return "audio";
        case ARCHIVE:
            return "archive";
        case CODE:
            return "code";
        case TEXT:
            return "text";
        default:
            return "file";
        }
    }

} // namespace fs
