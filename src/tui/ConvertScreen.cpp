#include "tui/ConvertScreen.hpp"

#include <algorithm>
#include <initializer_list>
#include <sstream>
#include <system_error>
#include <utility>

#include <notcurses/notcurses.h>

#include "converter/Errors.hpp"
#include "converter/LibavEngine.hpp"
#include "converter/OutputNaming.hpp"
#include "converter/SelfTest.hpp"
#include "converter/SvxConverter.hpp"
#include "tui/StateMachine.hpp"

namespace {
constexpr int kMargin = 1;
constexpr int kGap = 2;
constexpr int kFooterRows = 8;

bool IsEnter(uint32_t input) {
    return input == NCKEY_ENTER || input == '\n' || input == '\r';
}

std::string NormalizePath(const std::string& raw) {
    std::string trimmed = raw;
    while (!trimmed.empty() && (trimmed.front() == '\"' || trimmed.front() == '\'')) {
        trimmed.erase(trimmed.begin());
    }
    while (!trimmed.empty() && (trimmed.back() == '\"' || trimmed.back() == '\'')) {
        trimmed.pop_back();
    }
    return trimmed;
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

void ComputeLayout(unsigned parent_rows, int& top_rows, int& mid_rows, int& footer_y) {
    int avail = static_cast<int>(parent_rows) - (kMargin * 2) - (kGap * 2) - kFooterRows;
    if (avail < 12) {
        avail = 12;
    }
    top_rows = std::max(6, avail / 2);
    mid_rows = std::max(6, avail - top_rows);
    footer_y = kMargin + top_rows + kGap + mid_rows + kGap;
}

// Places a panel in the two-column grid above the command bar.
Subframe::Geometry GridCell(unsigned parent_rows, unsigned parent_cols, bool left, bool top) {
    int top_rows = 0;
    int mid_rows = 0;
    int footer_y = 0;
    ComputeLayout(parent_rows, top_rows, mid_rows, footer_y);

    Subframe::Geometry cell;
    const int available_width = static_cast<int>(parent_cols) - (kMargin * 2) - kGap;
    cell.cols = std::max(20, available_width / 2);
    cell.x = left ? kMargin : kMargin + cell.cols + kGap;
    if (top) {
        cell.rows = top_rows;
        cell.y = kMargin;
    } else {
        cell.rows = mid_rows;
        cell.y = std::max(kMargin, kMargin + top_rows + kGap - 2);
    }
    return cell;
}

// Resolve the configured output folder against the working directory; it must
// stay inside it and must not pass through a symlink.
std::filesystem::path ResolveOutputFolder(const std::string& raw,
                                          const std::function<void(const std::string&)>& feedback) {
    std::error_code ec;
    std::filesystem::path base = std::filesystem::current_path(ec);
    if (ec) {
        base = ".";
    }
    const std::filesystem::path fallback = base / kDefaultOutputFolder;

    std::filesystem::path normalized = NormalizePath(raw);
    if (normalized.empty()) {
        feedback("Warning: Empty output folder; using " + fallback.string());
        return fallback;
    }
    if (normalized.is_relative()) {
        normalized = base / normalized;
    }
    const std::filesystem::path weak = std::filesystem::weakly_canonical(normalized, ec);
    if (ec) {
        feedback("Warning: Output folder error; using " + fallback.string());
        return fallback;
    }
    const std::filesystem::path abs_base = std::filesystem::weakly_canonical(base, ec);
    if (!ec && weak.string().rfind(abs_base.string(), 0) != 0) {
        feedback("Warning: Output folder outside working directory; using " + fallback.string());
        return fallback;
    }
    std::filesystem::path current;
    for (const auto& part : weak) {
        current /= part;
        if (std::filesystem::is_symlink(current, ec)) {
            feedback("Warning: Symlink in output folder blocked; using " + fallback.string());
            return fallback;
        }
    }
    return weak;
}
}

ConvertScreen::ConvertScreen(ConverterConfig& config, bool& config_changed)
    : jobs_(),
      focus_(Focus::Commands),
      config_(config),
      config_changed_(config_changed),
      file_subframe_(true),
      job_subframe_(false, jobs_, jobs_mutex_),
      config_subframe_(config_, config_changed_),
      plan_subframe_(),
      command_subframe_() {}

ConvertScreen::~ConvertScreen() {
    worker_.RequestStop();
    worker_.Wait();
}

ConvertScreen::FileSubframe::FileSubframe(bool is_left) : is_left_(is_left) {}

ConvertScreen::JobSubframe::JobSubframe(bool is_left, std::vector<std::string>& jobs, std::mutex& jobs_mutex)
    : jobs_(&jobs), is_left_(is_left), jobs_mutex_(&jobs_mutex) {}

ConvertScreen::ConfigSubframe::ConfigSubframe(ConverterConfig& config, bool& config_changed)
    : config_(config), config_changed_(config_changed) {}

ConvertScreen::PlanSubframe::PlanSubframe() {
    lines_.push_back("Select a file and choose Preview");
    lines_.push_back("(or press p in the file list).");
}

ConvertScreen::CommandSubframe::CommandSubframe() {
    log_.push_back("Ready");
}

void ConvertScreen::Enter(ScreenContext&) {
    file_subframe_.RefreshListing();
}

void ConvertScreen::Draw(ScreenContext& ctx) {
    ncpp::Plane& stdplane = ctx.stdplane;
    stdplane.erase();
    DrawScreenFrame(stdplane, "IFF 8SVX Converter");
    unsigned rows = 0;
    unsigned cols = 0;
    stdplane.get_dim(rows, cols);

    file_subframe_.SetFocused(focus_ == Focus::Files);
    job_subframe_.SetFocused(focus_ == Focus::Jobs);
    config_subframe_.SetFocused(focus_ == Focus::Config);
    plan_subframe_.SetFocused(focus_ == Focus::Plan);
    command_subframe_.SetFocused(focus_ == Focus::Commands);

    for (Subframe* panel : std::initializer_list<Subframe*>{
             &file_subframe_, &job_subframe_, &config_subframe_, &plan_subframe_, &command_subframe_}) {
        panel->Layout(stdplane, rows, cols);
        panel->Draw();
    }
}

bool ConvertScreen::CapturesText() const {
    return focus_ == Focus::Config && config_subframe_.Editing();
}

void ConvertScreen::QueueSelection() {
    const FileBrowser::Entry* entry = file_subframe_.CurrentEntry();
    if (entry == nullptr || entry->name == "..") {
        return;
    }
    const std::filesystem::path selected = file_subframe_.SelectedPath();
    std::vector<std::filesystem::path> added;
    if (entry->is_dir) {
        added = FileBrowser::AudioFilesIn(selected);
        if (added.empty()) {
            command_subframe_.SetFeedback("No audio files in " + selected.filename().string());
            return;
        }
    } else {
        added.push_back(selected);
    }

    std::lock_guard<std::mutex> lock(jobs_mutex_);
    for (const std::filesystem::path& path : added) {
        jobs_.push_back(path.string());
    }
    command_subframe_.SetFeedback("Queued " + std::to_string(added.size()) + " file(s)");
}

void ConvertScreen::ShowPreview() {
    std::filesystem::path input;
    const FileBrowser::Entry* entry = file_subframe_.CurrentEntry();
    if (entry != nullptr && !entry->is_dir) {
        input = file_subframe_.SelectedPath();
    } else {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        if (!jobs_.empty()) {
            input = jobs_.front();
        }
    }
    if (input.empty()) {
        command_subframe_.SetFeedback("Nothing to preview: select a file or queue a job");
        return;
    }

    try {
        LibavEngine engine;
        SvxConverter converter(engine, OptionsFromConfig(config_));
        plan_subframe_.SetText(FormatPreview(converter.Preview(input), converter.Options()));
        command_subframe_.SetFeedback("Preview: " + input.filename().string());
    } catch (const std::exception& e) {
        plan_subframe_.SetText(std::string("Preview failed:\n") + e.what());
        command_subframe_.SetFeedback(std::string("Error: ") + e.what());
    }
}

bool ConvertScreen::LaunchWorker(BackgroundWorker::Task task) {
    if (!worker_.Launch(std::move(task))) {
        command_subframe_.SetFeedback("Worker busy; stop it first");
        return false;
    }
    return true;
}

void ConvertScreen::StartConversions() {
    ConversionOptions options;
    try {
        options = OptionsFromConfig(config_);
    } catch (const InvalidConfig& e) {
        command_subframe_.SetFeedback(std::string("Error: ") + e.what());
        return;
    }
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        if (jobs_.empty()) {
            command_subframe_.SetFeedback("No jobs to convert");
            return;
        }
    }
    auto feedback = [this](const std::string& msg) { command_subframe_.SetFeedback(msg); };
    const std::filesystem::path out_dir =
        ResolveOutputFolder(config_.GetString(config_keys::kOutputFolder, kDefaultOutputFolder), feedback);

    if (LaunchWorker([this, options, out_dir](const std::atomic<bool>& stop) { ConvertQueued(options, out_dir, stop); })) {
        command_subframe_.SetFeedback("Conversion started -> " + out_dir.string());
    }
}

void ConvertScreen::ConvertQueued(const ConversionOptions& options, const std::filesystem::path& out_dir,
                                  const std::atomic<bool>& stop) {
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
        command_subframe_.SetFeedback("Error: Could not create " + out_dir.string() + ": " + ec.message());
        return;
    }

    LibavEngine engine;
    engine.SetProgressCallback([this](double p) { job_subframe_.UpdateProgress(p); });
    SvxConverter converter(engine, options);

    int converted = 0;
    while (!stop.load(std::memory_order_relaxed)) {
        std::string job_path;
        {
            std::lock_guard<std::mutex> guard(jobs_mutex_);
            if (jobs_.empty()) {
                break;
            }
            job_path = jobs_.front();
            jobs_.erase(jobs_.begin());
        }

        const std::filesystem::path input(job_path);
        if (!std::filesystem::is_regular_file(input, ec)) {
            command_subframe_.SetFeedback("Warning: Skipping (not found): " + job_path);
            continue;
        }

        job_subframe_.BeginConversionDisplay(input.filename().string());
        try {
            // Only this thread writes into out_dir, so the name stays free until written.
            const std::filesystem::path output = UniqueOutputPath(out_dir, SanitizeBaseName(input));
            const ConversionResult result = converter.ConvertFile(input, output);
            command_subframe_.SetFeedback("Converted " + FormatResult(result));
            ++converted;
        } catch (const std::exception& e) {
            command_subframe_.SetFeedback(std::string("Error: ") + input.filename().string() + ": " + e.what());
            job_subframe_.EndConversionDisplay();
            break;
        }
        job_subframe_.EndConversionDisplay();
    }

    if (!stop.load(std::memory_order_relaxed)) {
        command_subframe_.SetFeedback("Converted " + std::to_string(converted) + " file(s) to " + out_dir.string());
    } else {
        command_subframe_.SetFeedback("Conversion stopped after " + std::to_string(converted) + " file(s)");
    }
}

// The file in progress runs to completion; the worker reports when it halts.
void ConvertScreen::StopConversions() {
    if (!worker_.Busy()) {
        command_subframe_.SetFeedback("Nothing to stop");
        return;
    }
    worker_.RequestStop();
    command_subframe_.SetFeedback("Stopping after the current file");
}

void ConvertScreen::StartSelfTest() {
    const bool started = LaunchWorker([this](const std::atomic<bool>&) {
        std::error_code ec;
        std::filesystem::path scratch = std::filesystem::temp_directory_path(ec);
        if (ec) {
            scratch = ".";
        }
        scratch /= "svxconv_selftest";

        std::ostringstream report;
        try {
            LibavEngine engine;
            SelfTestOracle oracle(engine, scratch, report);
            oracle.Run();
        } catch (const std::exception& e) {
            report << "Self-test aborted: " << e.what() << "\n";
        }
        for (const std::string& line : SplitLines(report.str())) {
            if (!line.empty()) {
                command_subframe_.SetFeedback(line);
            }
        }
    });
    if (started) {
        command_subframe_.SetFeedback("Running self-tests...");
    }
}

void ConvertScreen::HandleInput(ScreenContext& ctx, uint32_t input, const ncinput& details) {
    if (CapturesText()) {
        config_subframe_.HandleInput(input, details);
        return;
    }

    if (input == '\t') {
        if (focus_ == Focus::Commands) {
            focus_ = Focus::Files;
        } else if (focus_ == Focus::Files) {
            focus_ = Focus::Jobs;
        } else if (focus_ == Focus::Jobs) {
            focus_ = Focus::Config;
        } else if (focus_ == Focus::Config) {
            focus_ = Focus::Plan;
        } else {
            focus_ = Focus::Commands;
        }
        return;
    }

    if (input == NCKEY_ESC) {
        ctx.machine.TransitionTo("welcome");
        return;
    }

    if (focus_ == Focus::Commands) {
        if (IsEnter(input)) {
            const std::string& opt = command_subframe_.SelectedOption();
            if (opt == "Start") {
                StartConversions();
            } else if (opt == "Stop") {
                StopConversions();
            } else if (opt == "Preview") {
                ShowPreview();
            } else if (opt == "Self-test") {
                StartSelfTest();
            } else if (opt == "Exit") {
                ctx.machine.SetRunning(false);
                command_subframe_.SetFeedback("Exit requested");
            }
        } else {
            command_subframe_.HandleInput(input, details);
        }
        return;
    }

    if (focus_ == Focus::Files && input == 's') {
        QueueSelection();
        return;
    }

    if (focus_ == Focus::Files && input == 'p') {
        ShowPreview();
        return;
    }

    if (focus_ == Focus::Jobs && input == 's') {
        const std::string removed = job_subframe_.RemoveSelected();
        if (!removed.empty()) {
            command_subframe_.SetFeedback("Removed " + std::filesystem::path(removed).filename().string());
        }
        return;
    }

    if (focus_ == Focus::Files) {
        file_subframe_.HandleInput(input, details);
    } else if (focus_ == Focus::Jobs) {
        job_subframe_.HandleInput(input, details);
    } else if (focus_ == Focus::Config) {
        config_subframe_.HandleInput(input, details);
    } else if (focus_ == Focus::Plan) {
        plan_subframe_.HandleInput(input, details);
    }
}

Subframe::Geometry ConvertScreen::FileSubframe::Place(unsigned parent_rows, unsigned parent_cols) const {
    return GridCell(parent_rows, parent_cols, is_left_, true);
}

void ConvertScreen::FileSubframe::DrawContents() {
    DrawFrame("File Selection");
    DrawList();
}

std::string ConvertScreen::FileSubframe::LabelFor(const FileBrowser::Entry& entry) {
    std::string label = entry.name;
    if (entry.is_dir && label != "..") {
        label.append("/");
    } else if (entry.is_audio) {
        label.insert(0, "~ ");
    }
    return label;
}

void ConvertScreen::FileSubframe::DrawList() {
    const ContentArea area = ContentBox(1, 2, 1, 2);
    const int text_width = std::max(0, area.width - 1);
    const std::vector<FileBrowser::Entry>& entries = browser_.Entries();
    const int count = static_cast<int>(entries.size());
    const int selected = static_cast<int>(browser_.SelectedIndex());

    if (selected != static_cast<int>(last_selected_index_)) {
        horizontal_offset_ = 0;
        last_selected_index_ = static_cast<std::size_t>(selected);
    }
    scroll_offset_ = ScrollToShow(selected, scroll_offset_, area.height);

    for (int row = 0; row < area.height && scroll_offset_ + row < count; ++row) {
        const int index = scroll_offset_ + row;
        const std::string label = LabelFor(entries[static_cast<std::size_t>(index)]);
        PutListRow(area.top + row, area.left, text_width, ShiftedLabel(label, horizontal_offset_, text_width),
                   index == selected);
    }
    DrawScrollThumb(area.top, area.left + area.width - 1, area.height, count, scroll_offset_);
}

void ConvertScreen::FileSubframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)details;
    if (input == NCKEY_UP) {
        browser_.MoveSelectionUp();
        horizontal_offset_ = 0;
    } else if (input == NCKEY_DOWN) {
        browser_.MoveSelectionDown();
        horizontal_offset_ = 0;
    } else if (IsEnter(input)) {
        browser_.ActivateSelection();
        scroll_offset_ = 0;
        horizontal_offset_ = 0;
    } else if (input == NCKEY_RIGHT || input == NCKEY_LEFT) {
        const FileBrowser::Entry* entry = CurrentEntry();
        if (entry != nullptr) {
            const int width = std::max(0, ContentBox(1, 2, 1, 2).width - 1);
            const int limit = std::max(0, static_cast<int>(LabelFor(*entry).size()) - width);
            horizontal_offset_ = std::min(std::max(horizontal_offset_ + (input == NCKEY_RIGHT ? 1 : -1), 0), limit);
        }
    }
}

const FileBrowser::Entry* ConvertScreen::FileSubframe::CurrentEntry() const {
    const std::vector<FileBrowser::Entry>& entries = browser_.Entries();
    const std::size_t idx = browser_.SelectedIndex();
    if (idx >= entries.size()) {
        return nullptr;
    }
    return &entries[idx];
}

Subframe::Geometry ConvertScreen::JobSubframe::Place(unsigned parent_rows, unsigned parent_cols) const {
    return GridCell(parent_rows, parent_cols, is_left_, true);
}

void ConvertScreen::JobSubframe::DrawContents() {
    DrawFrame("Job List");
    DrawProgressBar();

    bool converting = false;
    std::string file;
    {
        std::lock_guard<std::mutex> lock(convert_mutex_);
        converting = converting_display_;
        file = converting_file_;
    }
    if (converting) {
        const ContentArea area = ContentBox(2, 2, 1, 2);
        plane_->putstr(area.top, area.left, "Converting:");
        plane_->putstr(area.top + 1, area.left, file.substr(0, static_cast<std::size_t>(std::max(0, area.width))).c_str());
    } else {
        DrawList();
    }
}

void ConvertScreen::JobSubframe::DrawList() {
    std::lock_guard<std::mutex> lock(*jobs_mutex_);
    const int count = static_cast<int>(jobs_->size());
    if (count == 0) {
        selected_index_ = 0;
        scroll_offset_ = 0;
        return;
    }

    const ContentArea area = ContentBox(2, 2, 1, 2); // row 1 is the progress bar
    const int text_width = std::max(0, area.width - 1);
    selected_index_ = std::min(std::max(selected_index_, 0), count - 1);
    scroll_offset_ = ScrollToShow(selected_index_, scroll_offset_, area.height);

    for (int row = 0; row < area.height && scroll_offset_ + row < count; ++row) {
        const int index = scroll_offset_ + row;
        PutListRow(area.top + row, area.left, text_width,
                   ShiftedLabel(jobs_->at(static_cast<std::size_t>(index)), horizontal_offset_, text_width),
                   index == selected_index_);
    }
}

void ConvertScreen::JobSubframe::DrawProgressBar() {
    const ContentArea area = ContentBox(1, 2, 1, 2);
    const int bar_width = std::max(1, area.width - 1);
    double value = 0.0;
    {
        std::lock_guard<std::mutex> lock(convert_mutex_);
        value = converting_display_ ? progress_value_ : 0.0;
    }
    const int filled = std::min(bar_width, static_cast<int>(value * bar_width));

    plane_->set_bg_rgb8(255, 255, 255);
    plane_->set_fg_rgb8(0, 0, 0);
    for (int col = 0; col < filled; ++col) {
        plane_->putstr(area.top, area.left + col, " ");
    }
    plane_->set_bg_default();
    plane_->set_fg_default();
}

void ConvertScreen::JobSubframe::BeginConversionDisplay(const std::string& file_name) {
    std::lock_guard<std::mutex> lock(convert_mutex_);
    converting_display_ = true;
    converting_file_ = file_name;
    progress_value_ = 0.0;
}

void ConvertScreen::JobSubframe::EndConversionDisplay() {
    std::lock_guard<std::mutex> lock(convert_mutex_);
    converting_display_ = false;
    converting_file_.clear();
    progress_value_ = 0.0;
}

void ConvertScreen::JobSubframe::UpdateProgress(double value) {
    std::lock_guard<std::mutex> lock(convert_mutex_);
    progress_value_ = value;
}

void ConvertScreen::JobSubframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)details;
    std::lock_guard<std::mutex> lock(*jobs_mutex_);
    if (jobs_->empty()) {
        return;
    }

    const int count = static_cast<int>(jobs_->size());

    if (input == NCKEY_UP) {
        selected_index_ = (selected_index_ - 1 + count) % count;
        horizontal_offset_ = 0;
    } else if (input == NCKEY_DOWN) {
        selected_index_ = (selected_index_ + 1) % count;
        horizontal_offset_ = 0;
    } else if (input == NCKEY_RIGHT || input == NCKEY_LEFT) {
        const std::string& label = jobs_->at(static_cast<std::size_t>(selected_index_ % count));
        const int width = std::max(0, ContentBox(2, 2, 1, 2).width - 1);
        const int limit = std::max(0, static_cast<int>(label.size()) - width);
        horizontal_offset_ = std::min(std::max(horizontal_offset_ + (input == NCKEY_RIGHT ? 1 : -1), 0), limit);
    }
}

std::string ConvertScreen::JobSubframe::RemoveSelected() {
    std::lock_guard<std::mutex> lock(*jobs_mutex_);
    if (selected_index_ < 0 || selected_index_ >= static_cast<int>(jobs_->size())) {
        return {};
    }
    std::string removed = jobs_->at(static_cast<std::size_t>(selected_index_));
    jobs_->erase(jobs_->begin() + selected_index_);
    if (selected_index_ >= static_cast<int>(jobs_->size())) {
        selected_index_ = std::max(0, static_cast<int>(jobs_->size()) - 1);
    }
    return removed;
}

Subframe::Geometry ConvertScreen::ConfigSubframe::Place(unsigned parent_rows, unsigned parent_cols) const {
    return GridCell(parent_rows, parent_cols, true, false);
}

void ConvertScreen::ConfigSubframe::DrawContents() {
    DrawFrame("Config Options");

    const ContentArea area = ContentBox(1, 2, 2, 2); // bottom row holds the edit line

    switch (mode_) {
    case Mode::Submenus:
        DrawSubmenus(area);
        break;
    case Mode::Options:
    case Mode::EditBool:
    case Mode::EditValue:
        DrawOptions(area);
        DrawEditLine(area);
        break;
    }
}

void ConvertScreen::ConfigSubframe::DrawSubmenus(const ContentArea& area) {
    for (int i = 0; i < area.height && i < static_cast<int>(submenu_titles_.size()); ++i) {
        PutListRow(area.top + i, area.left, area.width, submenu_titles_[static_cast<std::size_t>(i)],
                   i == submenu_index_);
    }
}

std::string ConvertScreen::ConfigSubframe::DisplayValue(const Option& opt) const {
    const std::string value = config_.GetString(opt.key, opt.fallback);
    if (value.empty()) {
        return "(off)";
    }
    return value;
}

void ConvertScreen::ConfigSubframe::DrawOptions(const ContentArea& area) {
    std::vector<std::string> labels;
    labels.reserve(current_options_.size() + 1);
    labels.push_back("(Back)");
    for (const Option& opt : current_options_) {
        labels.push_back(opt.label + ": " + DisplayValue(opt));
    }

    const int total_items = static_cast<int>(labels.size());
    scroll_offset_ = ScrollToShow(option_index_, scroll_offset_, area.height);

    for (int i = 0; i < area.height && (scroll_offset_ + i) < total_items; ++i) {
        const int idx = scroll_offset_ + i;
        PutListRow(area.top + i, area.left, area.width, labels[static_cast<std::size_t>(idx)], idx == option_index_);
    }
}

void ConvertScreen::ConfigSubframe::DrawEditLine(const ContentArea& area) {
    const int row = area.top + area.height; // first bottom padding row
    std::string line;

    if (mode_ == Mode::EditBool) {
        line = "Select: ";
        line += (bool_choice_ == 0) ? "[true] false" : "true [false]";
    } else if (mode_ == Mode::EditValue) {
        line = "Value: " + edit_buffer_ + "_";
    } else if (!error_.empty()) {
        line = error_;
    } else {
        return;
    }

    plane_->set_bg_default();
    plane_->set_fg_default();
    plane_->putstr(row, area.left, line.substr(0, static_cast<std::size_t>(std::max(0, area.width))).c_str());
}

const ConvertScreen::ConfigSubframe::Option* ConvertScreen::ConfigSubframe::SelectedOption() const {
    if (option_index_ <= 0 || option_index_ > static_cast<int>(current_options_.size())) {
        return nullptr;
    }
    return &current_options_[static_cast<std::size_t>(option_index_ - 1)];
}

void ConvertScreen::ConfigSubframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)details;

    if (mode_ == Mode::Submenus) {
        const int total = static_cast<int>(submenu_titles_.size());
        if (input == NCKEY_UP) {
            submenu_index_ = (submenu_index_ - 1 + total) % total;
        } else if (input == NCKEY_DOWN) {
            submenu_index_ = (submenu_index_ + 1) % total;
        } else if (IsEnter(input)) {
            EnterOptions();
        }
        return;
    }

    if (mode_ == Mode::Options) {
        const int total_items = static_cast<int>(current_options_.size()) + 1; // includes Back
        if (input == NCKEY_UP) {
            option_index_ = (option_index_ - 1 + total_items) % total_items;
        } else if (input == NCKEY_DOWN) {
            option_index_ = (option_index_ + 1) % total_items;
        } else if (IsEnter(input)) {
            const Option* opt = SelectedOption();
            error_.clear();
            if (opt == nullptr) {
                EnterSubmenus();
            } else if (opt->type == Option::Type::Bool) {
                mode_ = Mode::EditBool;
                bool_choice_ = config_.GetBool(opt->key, opt->fallback == "true") ? 0 : 1;
            } else {
                mode_ = Mode::EditValue;
                edit_buffer_ = config_.GetString(opt->key, opt->fallback);
            }
        }
        return;
    }

    if (mode_ == Mode::EditBool) {
        if (input == NCKEY_LEFT || input == NCKEY_RIGHT) {
            bool_choice_ = 1 - bool_choice_;
        } else if (IsEnter(input)) {
            CommitBool();
        } else if (input == NCKEY_ESC) {
            ResetEditLine();
            mode_ = Mode::Options;
        }
        return;
    }

    const Option* opt = SelectedOption();
    if (IsEnter(input)) {
        CommitValue();
    } else if (input == NCKEY_ESC) {
        ResetEditLine();
        mode_ = Mode::Options;
    } else if (input == NCKEY_BACKSPACE || input == 127) {
        if (!edit_buffer_.empty()) {
            edit_buffer_.pop_back();
        }
    } else if (opt != nullptr) {
        if (opt->type == Option::Type::Int) {
            if (input >= '0' && input <= '9') {
                edit_buffer_.push_back(static_cast<char>(input));
            }
        } else if (opt->type == Option::Type::Number) {
            if ((input >= '0' && input <= '9') || input == '.' || input == '-') {
                edit_buffer_.push_back(static_cast<char>(input));
            }
        } else if (input >= 32 && input <= 126) {
            // Accept printable ASCII for string options.
            edit_buffer_.push_back(static_cast<char>(input));
        }
    }
}

void ConvertScreen::ConfigSubframe::EnterOptions() {
    mode_ = Mode::Options;
    option_index_ = 0;
    scroll_offset_ = 0;
    error_.clear();
    current_options_.clear();

    if (submenu_index_ == 0) {
        current_options_.push_back(Option{config_keys::kSampleRate, "Sample rate Hz", Option::Type::Int, "16726"});
        current_options_.push_back(
            Option{config_keys::kOutputFolder, "Output folder", Option::Type::String, kDefaultOutputFolder});
    } else if (submenu_index_ == 1) {
        current_options_.push_back(Option{config_keys::kNormalize, "Normalize", Option::Type::Bool, "false"});
        current_options_.push_back(Option{config_keys::kGainDb, "Gain dB", Option::Type::Number, ""});
        current_options_.push_back(Option{config_keys::kTrimSilence, "Trim silence", Option::Type::Bool, "false"});
        current_options_.push_back(Option{config_keys::kDither, "TPDF dither", Option::Type::Bool, "true"});
    } else {
        current_options_.push_back(Option{config_keys::kAmigaLpf, "A500 low-pass", Option::Type::Bool, "false"});
        current_options_.push_back(Option{config_keys::kLpfCutoffHz, "Low-pass Hz", Option::Type::Number, ""});
    }
}

void ConvertScreen::ConfigSubframe::EnterSubmenus() {
    mode_ = Mode::Submenus;
    option_index_ = 0;
    scroll_offset_ = 0;
    ResetEditLine();
}

void ConvertScreen::ConfigSubframe::CommitBool() {
    const Option* opt = SelectedOption();
    if (opt != nullptr) {
        Commit(*opt, bool_choice_ == 0 ? "true" : "false");
    }
    ResetEditLine();
    mode_ = Mode::Options;
}

void ConvertScreen::ConfigSubframe::CommitValue() {
    const Option* opt = SelectedOption();
    // An empty value only makes sense for optional numbers.
    if (opt != nullptr && (!edit_buffer_.empty() || opt->type == Option::Type::Number)) {
        Commit(*opt, edit_buffer_);
    }
    ResetEditLine();
    mode_ = Mode::Options;
}

void ConvertScreen::ConfigSubframe::Commit(const Option& opt, const std::string& value) {
    // Check the edit against the whole option set before it reaches the live config.
    ConverterConfig trial = config_;
    trial.SetString(opt.key, value);
    try {
        OptionsFromConfig(trial);
    } catch (const InvalidConfig& e) {
        error_ = e.what();
        return;
    }
    config_ = trial;
    config_changed_ = true;
    error_.clear();
}

void ConvertScreen::ConfigSubframe::ResetEditLine() {
    bool_choice_ = 0;
    edit_buffer_.clear();
}

Subframe::Geometry ConvertScreen::PlanSubframe::Place(unsigned parent_rows, unsigned parent_cols) const {
    return GridCell(parent_rows, parent_cols, false, false);
}

void ConvertScreen::PlanSubframe::SetText(const std::string& text) {
    lines_ = SplitLines(text);
    scroll_offset_ = 0;
}

void ConvertScreen::PlanSubframe::DrawContents() {
    DrawFrame("Conversion Plan");
    const ContentArea area = ContentBox(1, 2, 1, 2);
    const int total = static_cast<int>(lines_.size());
    scroll_offset_ = std::min(scroll_offset_, std::max(0, total - area.height));
    for (int i = 0; i < area.height && (scroll_offset_ + i) < total; ++i) {
        PutListRow(area.top + i, area.left, area.width, lines_[static_cast<std::size_t>(scroll_offset_ + i)], false);
    }
}

void ConvertScreen::PlanSubframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)details;
    if (input == NCKEY_UP || input == NCKEY_BUTTON4) {
        if (scroll_offset_ > 0) {
            --scroll_offset_;
        }
    } else if (input == NCKEY_DOWN || input == NCKEY_BUTTON5) {
        ++scroll_offset_; // clamped on draw
    }
}

Subframe::Geometry ConvertScreen::CommandSubframe::Place(unsigned parent_rows, unsigned parent_cols) const {
    int top_rows = 0;
    int mid_rows = 0;
    int footer_y = 0;
    ComputeLayout(parent_rows, top_rows, mid_rows, footer_y);

    Geometry footer;
    footer.rows = kFooterRows;
    footer.cols = std::max(20, static_cast<int>(parent_cols) - (kMargin * 2));
    footer.y = footer_y - 2; // overlaps the grid gap
    footer.x = kMargin;
    return footer;
}

void ConvertScreen::CommandSubframe::DrawContents() {
    DrawFrame("Commands");
    const ContentArea area = ContentBox(1, 2, 1, 2);

    // Show feedback first (above), commands on bottom line.
    DrawFeedback(area);
    DrawOptions(area);
}

void ConvertScreen::CommandSubframe::DrawOptions(const ContentArea& area) {
    const int row = area.top + area.height - 1;
    int col = area.left;
    for (int i = 0; i < static_cast<int>(options_.size()); ++i) {
        const std::string& label = options_[static_cast<std::size_t>(i)];
        PutListRow(row, col, static_cast<int>(label.size()), label, i == selected_index_);
        col += static_cast<int>(label.size()) + 4;
    }
}

void ConvertScreen::CommandSubframe::DrawFeedback(const ContentArea& area) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    const int rows = std::max(0, area.height - 1); // last row holds the commands
    const int total = static_cast<int>(log_.size());
    const int shown = std::min(rows, total);
    // log_offset_ counts lines scrolled back from the newest entry.
    log_offset_ = std::min(log_offset_, total - shown);
    const int first = total - shown - log_offset_;

    const int text_width = std::max(0, area.width - 1);
    for (int row = 0; row < shown; ++row) {
        PutListRow(area.top + row, area.left, text_width, log_[static_cast<std::size_t>(first + row)], false);
    }
    DrawScrollThumb(area.top, area.left + area.width - 1, rows, total, first);
}

void ConvertScreen::CommandSubframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)details;
    const int count = static_cast<int>(options_.size());
    if (input == NCKEY_LEFT) {
        selected_index_ = (selected_index_ - 1 + count) % count;
    } else if (input == NCKEY_RIGHT) {
        selected_index_ = (selected_index_ + 1) % count;
    } else if (input == NCKEY_UP || input == NCKEY_BUTTON4) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        ++log_offset_;
    } else if (input == NCKEY_DOWN || input == NCKEY_BUTTON5) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (log_offset_ > 0) {
            --log_offset_;
        }
    }
}

void ConvertScreen::CommandSubframe::SetFeedback(const std::string& text) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_.push_back(text);
    if (log_.size() > 200) {
        log_.erase(log_.begin(), log_.begin() + static_cast<std::ptrdiff_t>(log_.size() - 200));
    }
    log_offset_ = 0;
}
