#define Uses_MsgBox
#define Uses_TButton
#define Uses_TDeskTop
#define Uses_TDialog
#define Uses_TLabel
#define Uses_TObject
#define Uses_TProgram
#define Uses_TRadioButtons
#define Uses_TRect
#define Uses_TSItem
#define Uses_TStaticText
#include "markdd/edit/info_dialogs.hpp"

#include "markdd/hotkeys.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace markdd::edit
{
    namespace
    {
        constexpr std::string_view kAboutDescription =
            "A keyboard-first Markdown editor. Enter continues bullet, numbered and task lists, "
            "Tab and Shift-Tab re-indent whole blocks, and inline styles toggle with a single shortcut.";

        std::vector<std::string> splitLines(const std::string &text)
        {
            std::vector<std::string> lines;
            std::istringstream in(text);
            std::string line;
            while (std::getline(in, line))
                lines.push_back(line);
            return lines;
        }

        ushort runModal(TDialog *dialog, void *data)
        {
            TView *view = TProgram::application->validView(dialog);
            if (!view)
                return cmCancel;
            if (data)
                view->setData(data);
            ushort result = TProgram::deskTop->execView(view);
            if (result != cmCancel && data)
                view->getData(data);
            TObject::destroy(view);
            return result;
        }

    } // namespace

    std::string aboutText(std::string_view version, std::string_view build)
    {
        std::ostringstream out;
        out << kAppDisplayName << "\n\n" << kAboutDescription;
        if (!version.empty())
            out << "\n\nVersion: " << version;
        if (!build.empty())
            out << "\n\nBuild: " << build;
        return out.str();
    }

    std::string statisticsText(const core::DocumentStats &stats, const core::CursorPosition &position)
    {
        std::ostringstream text;
        text << "Words:      " << stats.words << '\n'
             << "Characters: " << stats.characters << '\n'
             << "Lines:      " << stats.lines << '\n'
             << "Cursor:     Ln " << position.line << ", Col " << position.column;
        return text.str();
    }

    std::string hotkeyListText(std::string_view schemeId)
    {
        std::ostringstream text;
        for (const auto &binding : hotkeys::schemeBindings(schemeId))
        {
            std::string label = hotkeys::commandLabel(binding.command);
            if (label.empty())
                continue;
            text << std::left << std::setw(10) << binding.display << ' ' << label << '\n';
        }
        return text.str();
    }

    void showInfoDialog(std::string_view title, const std::string &message)
    {
        std::vector<std::string> lines = splitLines(message);
        int textWidth = 0;
        for (const auto &line : lines)
            textWidth = std::max(textWidth, strwidth(TStringView(line.data(), line.size())));

        const TPoint desk = TProgram::deskTop->size;
        const int width = std::min<int>(desk.x, std::max(40, textWidth + 6));
        const int height = std::min<int>(desk.y, std::max(9, static_cast<int>(lines.size()) + 6));

        std::string titleText(title);
        auto *dialog = new TDialog(TRect(0, 0, width, height), titleText.c_str());
        dialog->options |= ofCentered;
        dialog->insert(new TStaticText(TRect(3, 2, width - 2, height - 3), TStringView(message.data(), message.size())));
        dialog->insert(new TButton(TRect(width / 2 - 5, height - 3, width / 2 + 5, height - 1), MsgBoxText::okText,
                                   cmOK, bfDefault));
        dialog->selectNext(False);
        runModal(dialog, nullptr);
    }

    std::optional<std::string> chooseHotkeyScheme(std::string_view current)
    {
        auto schemes = hotkeys::availableSchemes();
        ushort selected = 0;
        TSItem *items = nullptr;
        for (std::size_t i = schemes.size(); i-- > 0;)
        {
            items = new TSItem(schemes[i].second.c_str(), items);
            if (schemes[i].first == current)
                selected = static_cast<ushort>(i);
        }

        const int rows = static_cast<int>(schemes.size());
        auto *dialog = new TDialog(TRect(0, 0, 36, rows + 8), "Hotkey Scheme");
        dialog->options |= ofCentered;
        auto *buttons = new TRadioButtons(TRect(3, 3, 33, 3 + rows), items);
        dialog->insert(buttons);
        dialog->insert(new TLabel(TRect(2, 2, 20, 3), "~S~cheme", buttons));
        dialog->insert(new TButton(TRect(12, rows + 5, 22, rows + 7), "O~K~", cmOK, bfDefault));
        dialog->insert(new TButton(TRect(23, rows + 5, 33, rows + 7), "Cancel", cmCancel, bfNormal));
        dialog->selectNext(False);

        if (runModal(dialog, &selected) == cmCancel || selected >= schemes.size())
            return std::nullopt;
        return schemes[selected].first;
    }

} // namespace markdd::edit
