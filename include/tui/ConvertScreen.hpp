#ifndef TUI_CONVERTSCREEN_HPP
#define TUI_CONVERTSCREEN_HPP

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "converter/ConverterConfig.hpp"
#include "tui/BackgroundWorker.hpp"
#include "tui/BaseScreen.hpp"
#include "tui/FileBrowser.hpp"
#include "tui/Subframe.hpp"

// Main converter screen: file picker, job queue, option editor, plan preview
// and a command bar. Conversions and self-tests run on one worker thread.
class ConvertScreen : public BaseScreen {
public:
    ConvertScreen(ConverterConfig& config, bool& config_changed);
    ~ConvertScreen() override;

    void Enter(ScreenContext& ctx) override;
    void Draw(ScreenContext& ctx) override;
    void HandleInput(ScreenContext& ctx, uint32_t input, const ncinput& details) override;
    bool CapturesText() const override;

private:
    enum class Focus {
        Commands,
        Files,
        Jobs,
        Config,
        Plan
    };

    class FileSubframe : public Subframe {
    public:
        explicit FileSubframe(bool is_left);
        void HandleInput(uint32_t input, const ncinput& details) override;

        void RefreshListing() { browser_.Load(browser_.CurrentPath()); }
        const FileBrowser::Entry* CurrentEntry() const;
        std::filesystem::path SelectedPath() const { return browser_.SelectedPath(); }

    protected:
        Geometry Place(unsigned parent_rows, unsigned parent_cols) const override;
        void DrawContents() override;

    private:
        void DrawList();
        static std::string LabelFor(const FileBrowser::Entry& entry);

        FileBrowser browser_;
        int scroll_offset_ = 0;
        bool is_left_;
        std::size_t last_selected_index_ = 0;
        int horizontal_offset_ = 0;
    };

    class JobSubframe : public Subframe {
    public:
        JobSubframe(bool is_left, std::vector<std::string>& jobs, std::mutex& jobs_mutex);
        void HandleInput(uint32_t input, const ncinput& details) override;

        std::string RemoveSelected();

        // Called from the worker thread.
        void BeginConversionDisplay(const std::string& file_name);
        void EndConversionDisplay();
        void UpdateProgress(double value);

    protected:
        Geometry Place(unsigned parent_rows, unsigned parent_cols) const override;
        void DrawContents() override;

    private:
        void DrawList();
        void DrawProgressBar();

        std::vector<std::string>* jobs_;
        int selected_index_ = 0;
        int scroll_offset_ = 0;
        bool is_left_;
        int horizontal_offset_ = 0;
        std::mutex* jobs_mutex_;

        std::mutex convert_mutex_;
        bool converting_display_ = false;
        std::string converting_file_;
        double progress_value_ = 0.0;
    };

    class ConfigSubframe : public Subframe {
    public:
        ConfigSubframe(ConverterConfig& config, bool& config_changed);
        void HandleInput(uint32_t input, const ncinput& details) override;
        bool Editing() const { return mode_ == Mode::EditValue; }

    protected:
        Geometry Place(unsigned parent_rows, unsigned parent_cols) const override;
        void DrawContents() override;

    private:
        enum class Mode { Submenus, Options, EditBool, EditValue };

        struct Option {
            std::string key;
            std::string label;
            enum class Type { Bool, Int, Number, String } type;
            std::string fallback; // shown when the key is absent
        };

        void DrawSubmenus(const ContentArea& area);
        void DrawOptions(const ContentArea& area);
        void DrawEditLine(const ContentArea& area);
        void EnterOptions();
        void EnterSubmenus();
        void CommitBool();
        void CommitValue();
        void Commit(const Option& opt, const std::string& value);
        void ResetEditLine();
        const Option* SelectedOption() const;
        std::string DisplayValue(const Option& opt) const;

        ConverterConfig& config_;
        bool& config_changed_;
        Mode mode_ = Mode::Submenus;
        int submenu_index_ = 0;
        int option_index_ = 0;
        int scroll_offset_ = 0;
        int bool_choice_ = 0;
        std::string edit_buffer_;
        std::string error_;

        std::vector<Option> current_options_;
        const std::vector<std::string> submenu_titles_{"Output", "Processing", "Filters"};
    };

    // Shows the conversion plan of the last previewed file.
    class PlanSubframe : public Subframe {
    public:
        PlanSubframe();
        void HandleInput(uint32_t input, const ncinput& details) override;
        void SetText(const std::string& text);

    protected:
        Geometry Place(unsigned parent_rows, unsigned parent_cols) const override;
        void DrawContents() override;

    private:
        std::vector<std::string> lines_;
        int scroll_offset_ = 0;
    };

    class CommandSubframe : public Subframe {
    public:
        CommandSubframe();
        void HandleInput(uint32_t input, const ncinput& details) override;
        const std::string& SelectedOption() const { return options_[static_cast<std::size_t>(selected_index_)]; }
        // Thread-safe; appends to the scrollback log.
        void SetFeedback(const std::string& text);

    protected:
        Geometry Place(unsigned parent_rows, unsigned parent_cols) const override;
        void DrawContents() override;

    private:
        void DrawOptions(const ContentArea& area);
        void DrawFeedback(const ContentArea& area);

        std::vector<std::string> options_{"Start", "Stop", "Preview", "Self-test", "Exit"};
        int selected_index_ = 0;
        std::mutex log_mutex_;
        std::vector<std::string> log_;
        int log_offset_ = 0;
    };

    void QueueSelection();
    void ShowPreview();
    void StartConversions();
    void StopConversions();
    void StartSelfTest();
    bool LaunchWorker(BackgroundWorker::Task task);
    void ConvertQueued(const ConversionOptions& options, const std::filesystem::path& out_dir,
                       const std::atomic<bool>& stop);

    std::vector<std::string> jobs_;
    std::mutex jobs_mutex_;
    Focus focus_ = Focus::Commands;
    ConverterConfig& config_;
    bool& config_changed_;
    FileSubframe file_subframe_;
    JobSubframe job_subframe_;
    ConfigSubframe config_subframe_;
    PlanSubframe plan_subframe_;
    CommandSubframe command_subframe_;

    // Declared last so it stops before the panels it writes to are destroyed.
    BackgroundWorker worker_;
};

#endif // TUI_CONVERTSCREEN_HPP
