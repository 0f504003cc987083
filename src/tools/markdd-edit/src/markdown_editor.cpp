#include "markdd/edit/markdown_editor.hpp"

#include "markdd/commands/markdd_edit.hpp"
#include "markdd/edit/info_dialogs.hpp"
#include "markdd/hotkeys.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace markdd::edit
{
    namespace
    {
#ifndef MARKDD_EDIT_VERSION
#define MARKDD_EDIT_VERSION "0.0.0"
#endif
        namespace cmds = markdd::commands::edit;
        using Clock = core::AutosaveScheduler::Clock;

        constexpr int kMaxSearchLength = 255;
        constexpr int kFindHistoryId = 10;
        constexpr int kReplaceHistoryId = 11;
        constexpr int kPromptHistoryId = 12;
        constexpr auto kStatusMessageDuration = std::chrono::seconds(3);

        constexpr ushort kOptionCaseSensitive = 0x0001;
        constexpr ushort kOptionWholeWord = 0x0002;
        constexpr ushort kOptionRegex = 0x0004;

        struct FindDialogData
        {
            char find[kMaxSearchLength + 1] = {};
            ushort options = 0;
        };

        struct ReplaceDialogData
        {
            char find[kMaxSearchLength + 1] = {};
            char replace[kMaxSearchLength + 1] = {};
            ushort options = 0;
        };

        ushort encodeSearchOptions(const core::SearchOptions &options)
        {
            ushort value = 0;
            if (options.caseSensitive)
                value |= kOptionCaseSensitive;
            if (options.wholeWord)
                value |= kOptionWholeWord;
            if (options.regex)
                value |= kOptionRegex;
            return value;
        }

        core::SearchOptions decodeSearchOptions(ushort value)
        {
            core::SearchOptions options;
            options.caseSensitive = (value & kOptionCaseSensitive) != 0;
            options.wholeWord = (value & kOptionWholeWord) != 0;
            options.regex = (value & kOptionRegex) != 0;
            return options;
        }

        void copyField(char *target, const std::string &value)
        {
            std::size_t length = std::min<std::size_t>(value.size(), kMaxSearchLength);
            std::memcpy(target, value.data(), length);
            target[length] = '\0';
        }

        ushort execDialog(TDialog *d, void *data = nullptr)
        {
            TView *p = TProgram::application->validView(d);
            if (!p)
                return cmCancel;
            if (data)
                p->setData(data);
            ushort result = TProgram::deskTop->execView(p);
            if (result != cmCancel && data)
                p->getData(data);
            TObject::destroy(p);
            return result;
        }

        TCheckBoxes *makeSearchOptionBoxes(const TRect &bounds)
        {
            return new TCheckBoxes(bounds,
                                   new TSItem("~C~ase sensitive",
                                              new TSItem("~W~hole words only",
                                                         new TSItem("Regular ~e~xpression", nullptr))));
        }

        bool runFindDialog(SearchState &state)
        {
            auto *dialog = new TDialog(TRect(0, 0, 38, 13), "Find");
            dialog->options |= ofCentered;

            auto *findInput = new TInputLine(TRect(3, 3, 32, 4), kMaxSearchLength);
            dialog->insert(findInput);
            dialog->insert(new TLabel(TRect(2, 2, 15, 3), "~T~ext to find", findInput));
            dialog->insert(new THistory(TRect(32, 3, 35, 4), findInput, kFindHistoryId));
            dialog->insert(makeSearchOptionBoxes(TRect(3, 5, 35, 8)));

            dialog->insert(new TButton(TRect(14, 10, 24, 12), "O~K~", cmOK, bfDefault));
            dialog->insert(new TButton(TRect(26, 10, 36, 12), "Cancel", cmCancel, bfNormal));
            dialog->selectNext(False);

            FindDialogData data;
            copyField(data.find, state.query);
            data.options = encodeSearchOptions(state.options);
            if (execDialog(dialog, &data) == cmCancel)
                return false;

            state.query = data.find;
            state.options = decodeSearchOptions(data.options);
            return !state.query.empty();
        }

        // cmOK replaces the next match, cmYes replaces every match.
        ushort runReplaceDialog(SearchState &state)
        {
            auto *dialog = new TDialog(TRect(0, 0, 40, 16), "Replace");
            dialog->options |= ofCentered;

            auto *findInput = new TInputLine(TRect(3, 3, 34, 4), kMaxSearchLength);
            dialog->insert(findInput);
            dialog->insert(new TLabel(TRect(2, 2, 15, 3), "~T~ext to find", findInput));
            dialog->insert(new THistory(TRect(34, 3, 37, 4), findInput, kFindHistoryId));

            auto *replaceInput = new TInputLine(TRect(3, 6, 34, 7), kMaxSearchLength);
            dialog->insert(replaceInput);
            dialog->insert(new TLabel(TRect(2, 5, 12, 6), "~N~ew text", replaceInput));
            dialog->insert(new THistory(TRect(34, 6, 37, 7), replaceInput, kReplaceHistoryId));
            dialog->insert(makeSearchOptionBoxes(TRect(3, 8, 37, 11)));

            dialog->insert(new TButton(TRect(2, 13, 13, 15), "~R~eplace", cmOK, bfDefault));
            dialog->insert(new TButton(TRect(14, 13, 27, 15), "Replace ~A~ll", cmYes, bfNormal));
            dialog->insert(new TButton(TRect(28, 13, 38, 15), "Cancel", cmCancel, bfNormal));
            dialog->selectNext(False);

            ReplaceDialogData data;
            copyField(data.find, state.query);
            copyField(data.replace, state.replacement);
            data.options = encodeSearchOptions(state.options);
            ushort result = execDialog(dialog, &data);
            if (result == cmCancel)
                return cmCancel;

            state.query = data.find;
            state.replacement = data.replace;
            state.options = decodeSearchOptions(data.options);
            return state.query.empty() ? cmCancel : result;
        }

        std::optional<std::string> promptForText(const char *title, const char *label, const std::string &initial = {})
        {
            auto *dialog = new TDialog(TRect(0, 0, 50, 8), title);
            dialog->options |= ofCentered;

            auto *input = new TInputLine(TRect(3, 3, 44, 4), kMaxSearchLength);
            dialog->insert(input);
            dialog->insert(new TLabel(TRect(2, 2, 44, 3), label, input));
            dialog->insert(new THistory(TRect(44, 3, 47, 4), input, kPromptHistoryId));
            dialog->insert(new TButton(TRect(26, 5, 36, 7), "O~K~", cmOK, bfDefault));
            dialog->insert(new TButton(TRect(37, 5, 47, 7), "Cancel", cmCancel, bfNormal));
            dialog->selectNext(False);

            char text[kMaxSearchLength + 1] = {};
            copyField(text, initial);
            if (execDialog(dialog, text) == cmCancel)
                return std::nullopt;
            return std::string(text);
        }

        std::optional<int> promptForNumber(const char *title, const char *label, int defaultValue, int minValue,
                                           int maxValue)
        {
            auto text = promptForText(title, label, std::to_string(defaultValue));
            if (!text)
                return std::nullopt;
            try
            {
                return std::clamp(std::stoi(*text), minValue, maxValue);
            }
            catch (const std::invalid_argument &)
            {
                return defaultValue;
            }
            catch (const std::out_of_range &)
            {
                return defaultValue;
            }
        }

        class MarkdownStatusLine : public TStatusLine
        {
        public:
            MarkdownStatusLine(TRect r)
                : TStatusLine(r, *new TStatusDef(0, 0xFFFF, nullptr))
            {
                rebuildItems(false);
            }

            ~MarkdownStatusLine() override
            {
                disposeItemList(items);
                items = nullptr;
                if (defs)
                    defs->items = nullptr;
            }

            void setEditorPresent(bool present)
            {
                if (builtForEditor && *builtForEditor == present)
                    return;
                rebuildItems(present);
            }

            void setDocumentInfo(const std::string &info)
            {
                if (documentInfo == info)
                    return;
                documentInfo = info;
                drawView();
            }

            void showTemporaryMessage(const std::string &message)
            {
                temporaryMessage = message;
                showingTemporaryMessage = true;
                drawView();
            }

            void refreshBindings()
            {
                rebuildItems(builtForEditor.value_or(false));
            }

            void clearTemporaryMessage()
            {
                if (!showingTemporaryMessage)
                    return;
                showingTemporaryMessage = false;
                temporaryMessage.clear();
                drawView();
            }

            const char *hint(ushort) override
            {
                if (showingTemporaryMessage)
                    return temporaryMessage.c_str();
                return documentInfo.c_str();
            }

        private:
            std::optional<bool> builtForEditor;
            std::string documentInfo;
            std::string temporaryMessage;
            bool showingTemporaryMessage = false;

            void rebuildItems(bool hasEditor)
            {
                disposeItemList(items);
                items = nullptr;
                if (defs)
                    defs->items = nullptr;
                builtForEditor = hasEditor;

                std::vector<ushort> commands;
                if (hasEditor)
                    commands = {cmSave, cmFind, cmds::cmBold, cmds::cmItalic, cmds::cmInsertLink, cmQuit};
                else
                    commands = {cmNew, cmOpen, cmQuit};

                TStatusItem *head = nullptr;
                TStatusItem **tail = &head;
                for (ushort command : commands)
                {
                    std::string label = markdd::hotkeys::commandLabel(command);
                    if (label.empty())
                        continue;
                    auto *item = new TStatusItem(label.c_str(), kbNoKey, command);
                    markdd::hotkeys::configureStatusItem(*item, label);
                    *tail = item;
                    tail = &item->next;
                }

                items = head;
                if (defs)
                    defs->items = items;
                drawView();
            }

            static void disposeItemList(TStatusItem *item)
            {
                while (item)
                {
                    TStatusItem *next = item->next;
                    delete item;
                    item = next;
                }
            }
        };

        constexpr const char *kSmartListMenuBaseLabel = "Auto List Continuation";
        constexpr const char *kAutosaveMenuBaseLabel = "Autosave";
        TMenuItem *gSmartListMenuItem = nullptr;
        TMenuItem *gAutosaveMenuItem = nullptr;

        void updateToggleLabel(TMenuItem *item, const char *baseLabel, bool enabled)
        {
            if (!item)
                return;
            std::string label = std::string(enabled ? "[x] " : "[ ] ") + baseLabel;
            delete[] const_cast<char *>(item->name);
            item->name = newStr(label.c_str());
        }

        TSubMenu &makeFileMenu()
        {
            return *new TSubMenu("~F~ile", kbNoKey) +
                   *new TMenuItem("~N~ew", cmNew, kbNoKey, hcNoContext) +
                   *new TMenuItem("~O~pen...", cmOpen, kbNoKey, hcNoContext) +
                   *new TMenuItem("~S~ave", cmSave, kbNoKey, hcNoContext) +
                   *new TMenuItem("S~a~ve as...", cmSaveAs, kbNoKey) +
                   *new TMenuItem("~C~lose", cmClose, kbNoKey, hcNoContext) +
                   newLine() +
                   *new TMenuItem("E~x~it", cmQuit, kbNoKey, hcNoContext);
        }

        TSubMenu &makeEditMenu()
        {
            return *new TSubMenu("~E~dit", kbNoKey) +
                   *new TMenuItem("~U~ndo", cmUndo, kbNoKey, hcNoContext) +
                   *new TMenuItem("~R~edo", cmds::cmRedo, kbNoKey, hcNoContext) +
                   newLine() +
                   *new TMenuItem("Cu~t~", cmCut, kbNoKey, hcNoContext) +
                   *new TMenuItem("~C~opy", cmCopy, kbNoKey, hcNoContext) +
                   *new TMenuItem("~P~aste", cmPaste, kbNoKey, hcNoContext) +
                   *new TMenuItem("~D~elete", cmClear, kbNoKey, hcNoContext);
        }

        TSubMenu &makeSearchMenu()
        {
            return *new TSubMenu("~S~earch", kbNoKey) +
                   *new TMenuItem("~F~ind...", cmFind, kbNoKey, hcNoContext) +
                   *new TMenuItem("~R~eplace...", cmReplace, kbNoKey, hcNoContext) +
                   *new TMenuItem("Find ~N~ext", cmSearchAgain, kbNoKey, hcNoContext) +
                   *new TMenuItem("Find ~P~revious", cmds::cmFindPrevious, kbNoKey, hcNoContext);
        }

        TMenuItem &makeHeadingsItem()
        {
            TMenuItem &levels = *new TMenuItem("Heading ~1", cmds::cmHeading1, kbNoKey) +
                                *new TMenuItem("Heading ~2", cmds::cmHeading2, kbNoKey) +
                                *new TMenuItem("Heading ~3", cmds::cmHeading3, kbNoKey) +
                                *new TMenuItem("Heading ~4", cmds::cmHeading4, kbNoKey) +
                                *new TMenuItem("Heading ~5", cmds::cmHeading5, kbNoKey) +
                                *new TMenuItem("Heading ~6", cmds::cmHeading6, kbNoKey);
            return *new TMenuItem("~H~eadings", kbNoKey, new TMenu(levels), hcNoContext);
        }

        TSubMenu &makeFormatMenu()
        {
            return *new TSubMenu("F~o~rmat", kbNoKey) +
                   *new TMenuItem("~B~old", cmds::cmBold, kbNoKey, hcNoContext) +
                   *new TMenuItem("~I~talic", cmds::cmItalic, kbNoKey, hcNoContext) +
                   *new TMenuItem("~S~trikethrough", cmds::cmStrikethrough, kbNoKey) +
                   *new TMenuItem("Hi~g~hlight", cmds::cmHighlight, kbNoKey) +
                   *new TMenuItem("Inline ~C~ode", cmds::cmInlineCode, kbNoKey) +
                   *new TMenuItem("Su~p~erscript", cmds::cmSuperscript, kbNoKey) +
                   *new TMenuItem("Subsc~r~ipt", cmds::cmSubscript, kbNoKey) +
                   newLine() +
                   makeHeadingsItem() +
                   newLine() +
                   *new TMenuItem("Increase Indent", cmds::cmIncreaseIndent, kbNoKey) +
                   *new TMenuItem("Decrease Indent", cmds::cmDecreaseIndent, kbNoKey);
        }

        TSubMenu &makeInsertMenu()
        {
            return *new TSubMenu("I~n~sert", kbNoKey) +
                   *new TMenuItem("~L~ink...", cmds::cmInsertLink, kbNoKey) +
                   *new TMenuItem("~I~mage...", cmds::cmInsertImage, kbNoKey) +
                   *new TMenuItem("~T~able...", cmds::cmInsertTable, kbNoKey) +
                   *new TMenuItem("~M~ath", cmds::cmInsertMath, kbNoKey) +
                   *new TMenuItem("~K~eyboard Shortcut", cmds::cmInsertKeyboardShortcut, kbNoKey) +
                   *new TMenuItem("Code ~B~lock...", cmds::cmCodeBlock, kbNoKey) +
                   *new TMenuItem("Horizontal ~R~ule", cmds::cmInsertHorizontalRule, kbNoKey);
        }

        TSubMenu &makeOptionsMenu()
        {
            gSmartListMenuItem = new TMenuItem(kSmartListMenuBaseLabel, cmds::cmToggleSmartList, kbNoKey);
            gAutosaveMenuItem = new TMenuItem(kAutosaveMenuBaseLabel, cmds::cmToggleAutosave, kbNoKey);
            return *new TSubMenu("O~p~tions", kbNoKey) + *gSmartListMenuItem + *gAutosaveMenuItem + newLine() +
                   *new TMenuItem("~H~otkey Scheme...", cmds::cmHotkeyScheme, kbNoKey);
        }

        TSubMenu &makeWindowMenu()
        {
            return *new TSubMenu("~W~indow", kbNoKey) +
                   *new TMenuItem("~R~esize/Move", cmResize, kbNoKey, hcNoContext) +
                   *new TMenuItem("~Z~oom", cmZoom, kbNoKey, hcNoContext) +
                   *new TMenuItem("~N~ext", cmNext, kbNoKey, hcNoContext) +
                   *new TMenuItem("~C~lose", cmClose, kbNoKey, hcNoContext) +
                   *new TMenuItem("~T~ile", cmTile, kbNoKey) +
                   *new TMenuItem("C~a~scade", cmCascade, kbNoKey);
        }

        TSubMenu &makeHelpMenu()
        {
            return *new TSubMenu("~H~elp", kbNoKey) +
                   *new TMenuItem("~H~otkeys", cmds::cmShowHotkeys, kbNoKey, hcNoContext) +
                   *new TMenuItem("Document ~S~tatistics", cmds::cmDocumentStats, kbNoKey, hcNoContext) +
                   *new TMenuItem("~A~bout", cmds::cmAbout, kbNoKey, hcNoContext);
        }

        struct BufferCommand
        {
            ushort command;
            void (*apply)(core::TextBuffer &);
        };

        // Commands that map onto a single buffer operation without a prompt.
        const BufferCommand kBufferCommands[] = {
            {cmds::cmStrikethrough, [](core::TextBuffer &b) { b.toggleStrikethrough(); }},
            {cmds::cmHighlight, [](core::TextBuffer &b) { b.toggleHighlight(); }},
            {cmds::cmInlineCode, [](core::TextBuffer &b) { b.toggleInlineCode(); }},
            {cmds::cmSuperscript, [](core::TextBuffer &b) { b.toggleSuperscript(); }},
            {cmds::cmSubscript, [](core::TextBuffer &b) { b.toggleSubscript(); }},
            {cmds::cmIncreaseIndent, [](core::TextBuffer &b) { b.indent(); }},
            {cmds::cmDecreaseIndent, [](core::TextBuffer &b) { b.outdent(); }},
            {cmds::cmInsertMath, [](core::TextBuffer &b) { b.insertMath(); }},
            {cmds::cmInsertKeyboardShortcut, [](core::TextBuffer &b) { b.insertKeyboardShortcut(); }},
            {cmds::cmInsertHorizontalRule, [](core::TextBuffer &b) { b.insertHorizontalRule(); }},
        };

        MarkdownEditorApp *editorApp()
        {
            return dynamic_cast<MarkdownEditorApp *>(TProgram::application);
        }

        std::string documentName(const std::optional<std::string> &file)
        {
            if (!file || file->empty())
                return "Untitled";
            std::filesystem::path path(*file);
            std::string name = path.filename().string();
            return name.empty() ? path.string() : name;
        }

        void applyToWindow(TView *view, void *args)
        {
            if (auto *window = dynamic_cast<MarkdownEditWindow *>(view))
                window->applySettings(*static_cast<const EditorSettings *>(args));
        }

        void pollWindowAutosave(TView *view, void *args)
        {
            if (auto *window = dynamic_cast<MarkdownEditWindow *>(view))
                window->pollAutosave(*static_cast<const Clock::time_point *>(args));
        }

        Boolean windowIsTileable(TView *view, void *)
        {
            return Boolean((view->options & ofTileable) != 0);
        }

    } // namespace

    MarkdownEditWindow::MarkdownEditWindow(const TRect &bounds, std::optional<std::string> fileName,
                                           std::string content, const EditorSettings &settings) noexcept
        : TWindowInit(&TWindow::initFrame), TWindow(bounds, "Untitled", wnNoNumber),
          textBuffer(std::make_unique<core::TextBuffer>())
    {
        options |= ofTileable;

        adoptDocument(*textBuffer, std::move(fileName), std::move(content));

        hScrollBar = new TScrollBar(TRect(2, size.y - 1, size.x - 2, size.y));
        insert(hScrollBar);

        vScrollBar = new TScrollBar(TRect(size.x - 1, 1, size.x, size.y - 1));
        insert(vScrollBar);

        bufferView = new MarkdownBufferView(TRect(1, 1, size.x - 1, size.y - 1), hScrollBar, vScrollBar, *textBuffer);
        insert(bufferView);

        subscription = textBuffer->subscribe([this](const core::ChangeEvent &event) { onBufferChanged(event); });
        applySettings(settings);
        updateWindowTitle();
    }

    MarkdownEditWindow::~MarkdownEditWindow()
    {
        textBuffer->unsubscribe(subscription);
    }

    void MarkdownEditWindow::focusEditor()
    {
        if (bufferView)
            bufferView->select();
    }

    void MarkdownEditWindow::applySettings(const EditorSettings &settings)
    {
        textBuffer->setSmartListContinuation(settings.smartListContinuation);
        autosave.configure(settings.autosaveEnabled, settings.autosaveInterval);
        autosave.onDocumentChanged(textBuffer->getCurrentFile().has_value(), textBuffer->isFileModified(),
                                   Clock::now());
    }

    void MarkdownEditWindow::onBufferChanged(const core::ChangeEvent &event)
    {
        if (bufferView)
            bufferView->syncFromBuffer();
        autosave.onDocumentChanged(event.currentFile.has_value(), event.isModified, Clock::now());
        updateWindowTitle();
        if (auto *app = editorApp())
            app->refreshStatus();
    }

    void MarkdownEditWindow::applyWindowTitle(const std::string &titleText)
    {
        if (title && titleText == title)
            return;
        if (title)
        {
            delete[] const_cast<char *>(title);
            title = nullptr;
        }
        title = newStr(titleText.c_str());
        if (frame)
            frame->drawView();
    }

    void MarkdownEditWindow::updateWindowTitle()
    {
        std::string displayName = documentName(textBuffer->getCurrentFile());
        if (textBuffer->isFileModified())
            displayName += " *";
        applyWindowTitle(displayName);
    }

    bool MarkdownEditWindow::saveDocument(bool forceSaveAs)
    {
        MarkdownEditorApp *app = editorApp();
        FileSaveCollaborator collaborator([app](const std::optional<std::string> &suggestion) -> std::optional<std::string> {
            if (!app)
                return std::nullopt;
            return app->promptSaveAs(suggestion);
        });
        collaborator.setForceSaveAs(forceSaveAs);

        core::SaveResult result = textBuffer->save(collaborator);
        autosave.onSaveResult(result.success, Clock::now());
        if (result.success)
        {
            updateWindowTitle();
            if (app)
                app->showStatusMessage("Document saved: " + result.filePath.value_or("Untitled"));
            return true;
        }
        if (result.error)
            messageBox(result.error->c_str(), mfError | mfOKButton);
        return false;
    }

    void MarkdownEditWindow::pollAutosave(Clock::time_point now)
    {
        if (!autosave.due(now) || !textBuffer->getCurrentFile())
            return;

        FileSaveCollaborator collaborator;
        core::SaveResult result = textBuffer->save(collaborator);
        autosave.onSaveResult(result.success, now);
        if (auto *app = editorApp())
        {
            if (result.success)
                app->showStatusMessage("Autosaved " + documentName(result.filePath));
            else
                app->showStatusMessage("Autosave failed: " + result.error.value_or("unknown error"));
        }
    }

    Boolean MarkdownEditWindow::valid(ushort command)
    {
        if ((command == cmClose || command == cmQuit) && textBuffer->isFileModified())
        {
            std::string text = documentName(textBuffer->getCurrentFile()) + " has been modified. Save?";
            switch (messageBox(text.c_str(), mfConfirmation | mfYesNoCancel))
            {
            case cmYes:
                if (!saveDocument(false))
                    return False;
                break;
            case cmNo:
                break;
            default:
                return False;
            }
        }
        return TWindow::valid(command);
    }

    bool MarkdownEditWindow::reportSearchError(const core::InvalidSearchPattern &error)
    {
        PLOGD << "Search rejected: " << error.what();
        messageBox("Invalid regular expression", mfError | mfOKButton);
        return false;
    }

    void MarkdownEditWindow::runFind(bool backwards)
    {
        MarkdownEditorApp *app = editorApp();
        if (!app)
            return;
        SearchState &state = app->search();
        if (state.query.empty() && !runFindDialog(state))
            return;

        bool found = false;
        try
        {
            found = backwards ? textBuffer->findPrevious(state.query, state.options)
                              : textBuffer->findNext(state.query, state.options);
        }
        catch (const core::InvalidSearchPattern &error)
        {
            reportSearchError(error);
            return;
        }

        bufferView->syncFromBuffer();
        if (!found)
            messageBox("Search string not found.", mfError | mfOKButton);
    }

    void MarkdownEditWindow::runReplace()
    {
        MarkdownEditorApp *app = editorApp();
        if (!app)
            return;
        SearchState &state = app->search();
        ushort choice = runReplaceDialog(state);
        if (choice == cmCancel)
            return;

        try
        {
            if (choice == cmYes)
            {
                std::size_t count = textBuffer->replaceAll(state.query, state.replacement, state.options);
                if (count == 0)
                    messageBox("Search string not found.", mfError | mfOKButton);
                else
                    app->showStatusMessage("Replaced " + std::to_string(count) + " occurrence(s)");
            }
            else
            {
                // The first call selects the next match when the selection is not one.
                if (!textBuffer->replaceCurrent(state.query, state.replacement, state.options) &&
                    !textBuffer->replaceCurrent(state.query, state.replacement, state.options))
                    messageBox("Search string not found.", mfError | mfOKButton);
            }
        }
        catch (const core::InvalidSearchPattern &error)
        {
            reportSearchError(error);
            return;
        }
        bufferView->syncFromBuffer();
    }

    void MarkdownEditWindow::insertLink(bool image)
    {
        auto url = promptForText(image ? "Insert Image" : "Insert Link", image ? "Image ~U~RL" : "Link ~U~RL");
        if (!url)
            return;
        if (image)
            textBuffer->insertImage(*url);
        else
            textBuffer->insertLink(*url);
    }

    void MarkdownEditWindow::insertTable()
    {
        auto rows = promptForNumber("Insert Table", "~R~ows (including header)", 3, 1, 50);
        if (!rows)
            return;
        auto columns = promptForNumber("Insert Table", "~C~olumns", 3, 1, 12);
        if (!columns)
            return;
        textBuffer->insertTable(*rows, *columns);
    }

    void MarkdownEditWindow::insertCodeBlock()
    {
        auto language = promptForText("Code Block", "~L~anguage (optional)");
        if (!language)
            return;
        textBuffer->insertCodeBlock(*language);
    }

    bool MarkdownEditWindow::handleEditCommand(ushort command)
    {
        auto runHostCommand = [this](core::ActionOutcome outcome) {
            switch (outcome.hostCommand)
            {
            case core::HostCommand::Save:
                saveDocument(false);
                break;
            case core::HostCommand::Find:
                if (MarkdownEditorApp *app = editorApp(); app && runFindDialog(app->search()))
                    runFind(false);
                break;
            case core::HostCommand::Replace:
                runReplace();
                break;
            case core::HostCommand::None:
                break;
            }
        };

        switch (command)
        {
        case cmSave:
            runHostCommand(textBuffer->dispatch(core::KeyAction::of(core::KeyActionKind::Save)));
            return true;
        case cmSaveAs:
            saveDocument(true);
            return true;
        case cmFind:
            runHostCommand(textBuffer->dispatch(core::KeyAction::of(core::KeyActionKind::Find)));
            return true;
        case cmReplace:
            runHostCommand(textBuffer->dispatch(core::KeyAction::of(core::KeyActionKind::Replace)));
            return true;
        case cmSearchAgain:
            runFind(false);
            return true;
        case cmds::cmFindPrevious:
            runFind(true);
            return true;
        case cmUndo:
            textBuffer->dispatch(core::KeyAction::of(core::KeyActionKind::Undo));
            return true;
        case cmds::cmRedo:
            textBuffer->dispatch(core::KeyAction::of(core::KeyActionKind::Redo));
            return true;
        case cmCut:
            bufferView->cutSelection();
            return true;
        case cmCopy:
            bufferView->copySelection();
            return true;
        case cmPaste:
            bufferView->paste();
            return true;
        case cmClear:
            if (!textBuffer->selection().isCaret())
                textBuffer->deleteForward();
            return true;
        case cmds::cmBold:
            textBuffer->dispatch(core::KeyAction::of(core::KeyActionKind::ToggleBold));
            return true;
        case cmds::cmItalic:
            textBuffer->dispatch(core::KeyAction::of(core::KeyActionKind::ToggleItalic));
            return true;
        case cmds::cmHeading1:
        case cmds::cmHeading2:
        case cmds::cmHeading3:
        case cmds::cmHeading4:
        case cmds::cmHeading5:
        case cmds::cmHeading6:
            textBuffer->insertHeading(command - cmds::cmHeading1 + 1);
            return true;
        case cmds::cmInsertLink:
            insertLink(false);
            return true;
        case cmds::cmInsertImage:
            insertLink(true);
            return true;
        case cmds::cmInsertTable:
            insertTable();
            return true;
        case cmds::cmCodeBlock:
            insertCodeBlock();
            return true;
        default:
            break;
        }

        for (const auto &entry : kBufferCommands)
        {
            if (entry.command == command)
            {
                entry.apply(*textBuffer);
                return true;
            }
        }
        return false;
    }

    void MarkdownEditWindow::handleEvent(TEvent &event)
    {
        TWindow::handleEvent(event);
        if (event.what == evCommand && handleEditCommand(event.message.command))
            clearEvent(event);
    }

    MarkdownEditorApp::MarkdownEditorApp(int argc, char **argv, config::SettingsStore &settingsStore)
        : TProgInit(&MarkdownEditorApp::initStatusLine, &MarkdownEditorApp::initMenuBar, &TApplication::initDeskTop),
          TApplication(), store(settingsStore), editorSettings(loadEditorSettings(settingsStore))
    {
        updateToggleLabel(gSmartListMenuItem, kSmartListMenuBaseLabel, editorSettings.smartListContinuation);
        updateToggleLabel(gAutosaveMenuItem, kAutosaveMenuBaseLabel, editorSettings.autosaveEnabled);

        bool opened = false;
        while (--argc > 0)
        {
            openPath(*++argv);
            opened = true;
        }
        if (!opened)
            fileNew();
        cascade();
        updateCommandState();
        refreshStatus();
    }

    MarkdownEditWindow *MarkdownEditorApp::openEditor(std::optional<std::string> fileName, std::string content)
    {
        TRect r = deskTop->getExtent();
        auto *win = (MarkdownEditWindow *)validView(
            new MarkdownEditWindow(r, std::move(fileName), std::move(content), editorSettings));
        if (!win)
            return nullptr;
        deskTop->insert(win);
        win->focusEditor();
        return win;
    }

    MarkdownEditWindow *MarkdownEditorApp::activeEditor() const
    {
        if (!deskTop || !deskTop->current)
            return nullptr;
        return dynamic_cast<MarkdownEditWindow *>(deskTop->current);
    }

    void MarkdownEditorApp::openPath(const std::string &path)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            PLOGI << "Starting new document " << path;
            openEditor(path, std::string());
            return;
        }

        LoadResult loaded = loadTextFile(path);
        if (!loaded.ok())
        {
            messageBox(loaded.error.c_str(), mfError | mfOKButton);
            return;
        }
        openEditor(path, std::move(*loaded.content));
    }

    void MarkdownEditorApp::fileOpen()
    {
        char name[MAXPATH] = "*.md";
        if (execDialog(new TFileDialog("*.md", "Open file", "~N~ame", fdOpenButton, 100), name) != cmCancel)
            openPath(name);
    }

    void MarkdownEditorApp::fileNew()
    {
        openEditor(std::nullopt, std::string());
    }

    std::optional<std::string> MarkdownEditorApp::promptSaveAs(const std::optional<std::string> &suggestion)
    {
        char name[MAXPATH] = "*.md";
        if (suggestion && suggestion->size() < sizeof(name))
            std::strcpy(name, suggestion->c_str());
        if (execDialog(new TFileDialog("*.md", "Save file as", "~N~ame", fdOKButton, 101), name) == cmCancel)
            return std::nullopt;
        return std::string(name);
    }

    void MarkdownEditorApp::showAbout()
    {
        showInfoDialog(MsgBoxText::informationText, aboutText(MARKDD_EDIT_VERSION, __DATE__ " " __TIME__));
    }

    void MarkdownEditorApp::showDocumentStats()
    {
        MarkdownEditWindow *win = activeEditor();
        if (!win)
            return;
        showInfoDialog("Document Statistics", statisticsText(win->buffer().stats(), win->buffer().cursorPosition()));
    }

    void MarkdownEditorApp::showHotkeys()
    {
        std::string scheme(markdd::hotkeys::activeScheme());
        showInfoDialog("Hotkeys (" + scheme + ")", hotkeyListText(scheme));
    }

    void MarkdownEditorApp::persistSettings()
    {
        storeEditorSettings(store, editorSettings);
        if (!store.save())
            showStatusMessage("Unable to save settings");
        deskTop->forEach(applyToWindow, &editorSettings);
    }

    void MarkdownEditorApp::toggleSmartLists()
    {
        editorSettings.smartListContinuation = !editorSettings.smartListContinuation;
        updateToggleLabel(gSmartListMenuItem, kSmartListMenuBaseLabel, editorSettings.smartListContinuation);
        persistSettings();
    }

    void MarkdownEditorApp::toggleAutosave()
    {
        editorSettings.autosaveEnabled = !editorSettings.autosaveEnabled;
        updateToggleLabel(gAutosaveMenuItem, kAutosaveMenuBaseLabel, editorSettings.autosaveEnabled);
        persistSettings();
        showStatusMessage(editorSettings.autosaveEnabled ? "Autosave enabled" : "Autosave disabled");
    }

    void MarkdownEditorApp::chooseHotkeys()
    {
        auto choice = chooseHotkeyScheme(editorSettings.hotkeyScheme);
        if (!choice || *choice == editorSettings.hotkeyScheme)
            return;
        if (!markdd::hotkeys::selectScheme(*choice))
            return;

        editorSettings.hotkeyScheme = *choice;
        markdd::hotkeys::configureMenuTree(*menuBar->menu->items);
        menuBar->drawView();
        if (auto *line = dynamic_cast<MarkdownStatusLine *>(statusLine))
            line->refreshBindings();
        persistSettings();
        showStatusMessage("Hotkey scheme: " + std::string(markdd::hotkeys::activeScheme()));
    }

    void MarkdownEditorApp::showStatusMessage(const std::string &message)
    {
        if (auto *line = dynamic_cast<MarkdownStatusLine *>(statusLine))
        {
            line->showTemporaryMessage(message);
            statusMessageExpiry = Clock::now() + kStatusMessageDuration;
        }
    }

    void MarkdownEditorApp::refreshStatus()
    {
        auto *line = dynamic_cast<MarkdownStatusLine *>(statusLine);
        if (!line)
            return;

        MarkdownEditWindow *win = activeEditor();
        line->setEditorPresent(win != nullptr);
        if (!win)
        {
            line->setDocumentInfo(std::string());
            return;
        }

        const core::TextBuffer &buffer = win->buffer();
        core::CursorPosition position = buffer.cursorPosition();
        std::ostringstream info;
        info << "Ln " << position.line << ", Col " << position.column << "  " << buffer.stats().words << " words";
        if (buffer.isFileModified())
            info << "  [modified]";
        line->setDocumentInfo(info.str());
    }

    void MarkdownEditorApp::updateCommandState()
    {
        TCommandSet editing;
        editing.enableCmd(cmSave);
        editing.enableCmd(cmSaveAs);
        editing.enableCmd(cmCut);
        editing.enableCmd(cmCopy);
        editing.enableCmd(cmPaste);
        editing.enableCmd(cmClear);
        editing.enableCmd(cmUndo);
        editing.enableCmd(cmFind);
        editing.enableCmd(cmReplace);
        editing.enableCmd(cmSearchAgain);
        if (activeEditor())
            enableCommands(editing);
        else
            disableCommands(editing);
    }

    void MarkdownEditorApp::handleEvent(TEvent &event)
    {
        TApplication::handleEvent(event);
        if (event.what != evCommand)
        {
            refreshStatus();
            return;
        }

        bool handled = true;
        switch (event.message.command)
        {
        case cmOpen:
            fileOpen();
            break;
        case cmNew:
            fileNew();
            break;
        case cmds::cmAbout:
            showAbout();
            break;
        case cmds::cmDocumentStats:
            showDocumentStats();
            break;
        case cmds::cmShowHotkeys:
            showHotkeys();
            break;
        case cmds::cmToggleSmartList:
            toggleSmartLists();
            break;
        case cmds::cmToggleAutosave:
            toggleAutosave();
            break;
        case cmds::cmHotkeyScheme:
            chooseHotkeys();
            break;
        default:
            handled = false;
            break;
        }
        if (handled)
            clearEvent(event);
        refreshStatus();
    }

    void MarkdownEditorApp::idle()
    {
        TApplication::idle();

        if (deskTop && deskTop->firstThat(windowIsTileable, nullptr) != nullptr)
        {
            enableCommand(cmTile);
            enableCommand(cmCascade);
        }
        else
        {
            disableCommand(cmTile);
            disableCommand(cmCascade);
        }
        updateCommandState();

        Clock::time_point now = Clock::now();
        if (deskTop)
            deskTop->forEach(pollWindowAutosave, &now);

        if (statusMessageExpiry && now >= *statusMessageExpiry)
        {
            statusMessageExpiry.reset();
            if (auto *line = dynamic_cast<MarkdownStatusLine *>(statusLine))
                line->clearTemporaryMessage();
        }
    }

    TMenuBar *MarkdownEditorApp::initMenuBar(TRect r)
    {
        r.b.y = r.a.y + 1;
        TMenuItem &items = makeFileMenu() + makeEditMenu() + makeSearchMenu() + makeFormatMenu() + makeInsertMenu() +
                           makeOptionsMenu() + makeWindowMenu() + makeHelpMenu();
        markdd::hotkeys::configureMenuTree(items);
        return new TMenuBar(r, new TMenu(items));
    }

    TStatusLine *MarkdownEditorApp::initStatusLine(TRect r)
    {
        r.a.y = r.b.y - 1;
        return new MarkdownStatusLine(r);
    }

} // namespace markdd::edit
