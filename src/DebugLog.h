#pragma once
// 调试日志 - 捕获 std::cout / std::cerr 输出，在 ImGui 调试面板中显示

#include <deque>
#include <mutex>
#include <streambuf>
#include <string>

class DebugLog {
  public:
    static DebugLog& Instance() {
        static DebugLog inst;
        return inst;
    }

    void Add(const std::string& msg, bool isError = false) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lines.push_back({msg, isError});
        if (m_lines.size() > MAX_LINES) {
            m_lines.pop_front();
        }
        m_scrollToBottom = true;
    }

    void Draw() {
        std::lock_guard<std::mutex> lock(m_mutex);
        ImGui::BeginChild("LogScroll", ImVec2(0, 200), true);
        for (const auto& line : m_lines) {
            if (line.isError) {
                ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.4f, 0.4f, 1.0f));
                ImGui::TextUnformatted(line.text.c_str());
                ImGui::PopStyleColor();
            } else {
                ImGui::TextUnformatted(line.text.c_str());
            }
        }
        if (m_scrollToBottom) {
            ImGui::SetScrollHereY(1.0f);
            m_scrollToBottom = false;
        }
        ImGui::EndChild();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lines.clear();
    }

    // 最近 maxLines 行 (0 = 全部)，错误行带 "! " 前缀
    std::string GetAllText(size_t maxLines = 0) {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::string                 result;
        size_t start = (maxLines > 0 && m_lines.size() > maxLines) ? m_lines.size() - maxLines : 0;
        for (size_t i = start; i < m_lines.size(); i++) {
            result += (m_lines[i].isError ? "! " : "") + m_lines[i].text + "\n";
        }
        return result;
    }

  private:
    struct Line {
        std::string text;
        bool        isError;
    };

    DebugLog() = default;
    std::deque<Line>    m_lines;
    std::mutex          m_mutex;
    bool                m_scrollToBottom = false;
    static const size_t MAX_LINES        = 200;
};

// 重定向 std::cout / std::cerr 到调试日志，同时保留原输出
class DebugStreamBuf : public std::streambuf {
  public:
    DebugStreamBuf(std::streambuf* orig, bool isError = false) : m_orig(orig), m_isError(isError) {}

  protected:
    int overflow(int c) override {
        if (c != EOF) {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (c == '\n') {
                DebugLog::Instance().Add(m_buffer, m_isError);
                m_buffer.clear();
            } else {
                m_buffer += (char)c;
            }
            if (m_orig) {
                m_orig->sputc((char)c);
            }
        }
        return c;
    }

    int sync() override { return m_orig ? m_orig->pubsync() : 0; }

  private:
    std::streambuf* m_orig;
    bool            m_isError;
    std::string     m_buffer;
    std::mutex      m_mutex;  // 摄像头线程也会写日志
};
