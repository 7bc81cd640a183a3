/** \file    PaperCheckerDefaults.cc
 *  \brief   Built-in stop words, academic lexicon and segmentation dictionary.
 *  \author  The paper_checker authors
 */

/*
 *  Copyright 2026 The paper_checker authors
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "PaperCheckerDefaults.h"
#include <iterator>
#include <stdexcept>
#include "FileUtil.h"
#include "StringUtil.h"
#include "util.h"


namespace PaperCheckerDefaults {


namespace {


const char * const STOP_WORDS[] = {
    "的", "了", "在", "是", "我", "有", "和", "就", "不", "人", "都", "一", "一个", "上", "也", "很", "到", "说", "要", "去",
    "你", "会", "着", "没有", "看", "好", "自己", "这个", "那个", "他", "她", "它", "我们", "你们", "他们", "这", "那", "哪",
    "怎么", "什么", "为什么", "因为", "所以", "但是", "虽然", "如果", "然后", "可以", "应该", "需要",
};


const char * const ACADEMIC_LEXICON[] = {
    "机器学习", "深度学习", "人工智能", "神经网络", "数据分析", "算法", "模型", "训练", "测试", "准确率", "召回率",
    "F1分数", "预处理", "特征工程", "过拟合", "欠拟合", "交叉验证",
};


const struct {
    const char *word_;
    unsigned frequency_;
} DICTIONARY_ENTRIES[] = {
    { "的", 318825 }, { "了", 88330 }, { "是", 96690 }, { "在", 82930 }, { "我", 56830 }, { "有", 66210 }, { "和", 60470 },
    { "就", 36390 }, { "不", 78270 }, { "人", 61380 }, { "都", 30100 }, { "一", 91230 }, { "上", 55360 }, { "也", 47830 },
    { "很", 22730 }, { "到", 42600 }, { "说", 39450 }, { "要", 44510 }, { "去", 25170 }, { "你", 33790 }, { "会", 39870 },
    { "着", 28590 }, { "看", 23520 }, { "好", 27440 }, { "他", 48830 }, { "她", 16550 }, { "它", 9870 }, { "这", 57240 },
    { "那", 19380 }, { "哪", 3180 }, { "中", 49870 }, { "天", 18350 }, { "年", 35610 }, { "月", 19260 }, { "日", 17350 },
    { "晴", 830 }, { "雨", 2610 }, { "周", 4790 }, { "家", 19870 }, { "大", 39830 }, { "小", 27620 }, { "多", 29430 },
    { "为", 47390 }, { "对", 38210 }, { "能", 27340 }, { "以", 39260 }, { "于", 28110 }, { "地", 31240 }, { "得", 27950 },
    { "之", 28740 }, { "与", 19350 }, { "及", 8740 }, { "等", 20310 }, { "把", 10380 }, { "被", 10870 }, { "从", 18720 },
    { "向", 9760 }, { "让", 9830 }, { "给", 10560 }, { "又", 9470 }, { "才", 8950 }, { "还", 19640 }, { "再", 9120 },
    { "最", 17380 }, { "更", 9840 }, { "个", 37420 }, { "些", 9650 }, { "种", 9480 }, { "版", 2790 }, { "用", 18930 },
    { "做", 9740 }, { "写", 4870 }, { "读", 2830 }, { "想", 9650 }, { "来", 29870 }, { "出", 19340 }, { "过", 18470 },
    { "下", 19830 }, { "里", 17640 }, { "后", 18250 }, { "前", 9870 }, { "时", 17560 }, { "新", 9730 }, { "高", 9620 },
    { "常", 3210 }, { "广", 2980 }, { "朗", 430 }, { "休", 760 }, { "息", 1120 }, { "今", 1830 }, { "明", 4320 },
    { "星", 1570 }, { "期", 2840 }, { "晚", 2190 }, { "电", 3670 }, { "影", 1980 }, { "打", 5430 }, { "算", 2410 },
    { "气", 4870 }, { "早", 2780 }, { "午", 980 }, { "今天", 5230 }, { "明天", 3140 }, { "昨天", 2070 }, { "后天", 480 },
    { "每天", 2790 }, { "天天", 1230 }, { "星期", 2180 }, { "星期天", 790 }, { "星期日", 520 }, { "星期一", 610 }, { "星期二", 380 },
    { "星期三", 360 }, { "星期四", 340 }, { "星期五", 420 }, { "星期六", 450 }, { "周末", 1020 }, { "天气", 3180 }, { "晴朗", 760 },
    { "晴天", 430 }, { "下雨", 820 }, { "雨天", 390 }, { "阴天", 320 }, { "晚上", 4090 }, { "早上", 2130 }, { "上午", 2240 },
    { "下午", 2310 }, { "中午", 1120 }, { "电影", 3020 }, { "电影院", 470 }, { "看见", 1980 }, { "打算", 1960 }, { "在家", 1030 },
    { "回家", 1510 }, { "休息", 1870 }, { "你好", 980 }, { "我们", 20390 }, { "你们", 5170 }, { "他们", 15280 }, { "自己", 10230 },
    { "这个", 15120 }, { "那个", 5070 }, { "一个", 29870 }, { "没有", 20450 }, { "怎么", 5230 }, { "什么", 14980 },
    { "为什么", 3070 }, { "因为", 8120 }, { "所以", 7920 }, { "但是", 8030 }, { "虽然", 2940 }, { "如果", 6120 }, { "然后", 3980 },
    { "可以", 15230 }, { "应该", 5970 }, { "需要", 7840 }, { "重要", 6080 }, { "分支", 470 }, { "一种", 4960 }, { "方法", 6130 },
    { "应用", 4870 }, { "广泛", 1980 }, { "常用", 970 }, { "中文", 1030 }, { "内容", 3920 }, { "原始", 1010 }, { "论文", 1480 },
    { "抄袭", 190 }, { "正常", 2040 }, { "文本", 780 }, { "文件", 2130 }, { "数据", 4980 }, { "分析", 4130 }, { "学习", 8020 },
    { "机器", 1970 }, { "人工", 1520 }, { "智能", 1480 }, { "深度", 1510 }, { "研究", 6050 }, { "问题", 8170 }, { "系统", 5980 },
    { "技术", 6020 }, { "发展", 7130 }, { "社会", 5970 }, { "经济", 6080 }, { "工作", 8130 }, { "时间", 7020 }, { "学生", 3970 },
    { "老师", 3020 }, { "学校", 2980 }, { "中国", 10120 }, { "国家", 6070 }, { "世界", 4020 }, { "生活", 5030 }, { "朋友", 2970 },
    { "知道", 5980 }, { "觉得", 3970 }, { "已经", 8060 }, { "现在", 7980 }, { "非常", 4030 }, { "一起", 3970 }, { "开始", 5020 },
    { "结果", 3980 }, { "相似", 510 }, { "相似度", 190 }, { "计算", 2970 }, { "检测", 1020 }, { "方面", 4020 }, { "进行", 6980 },
    { "通过", 6020 }, { "使用", 4970 }, { "提高", 3980 }, { "实验", 2480 }, { "理论", 2970 }, { "结构", 2510 }, { "过程", 3020 },
    { "信息", 4980 }, { "网络", 4010 }, { "计算机", 1990 }, { "软件", 1510 }, { "程序", 1480 }, { "设计", 3010 }, { "实现", 3970 },
    { "效果", 2020 }, { "性能", 1510 }, { "评估", 980 }, { "方案", 1490 }, { "文章", 1980 }, { "作者", 1510 }, { "引用", 690 },
    { "参考", 1020 }, { "文献", 990 },
};


// \return The trimmed lines of "path" minus blank lines and comment lines.
std::vector<std::string> ReadNonCommentLines(const std::string &path, const std::string &caller) {
    std::string contents;
    if (unlikely(not FileUtil::ReadString(path, &contents)))
        throw std::runtime_error("in PaperCheckerDefaults::" + caller + ": can't read \"" + path + "\"!");

    std::vector<std::string> lines;
    StringUtil::Split(contents, '\n', &lines);

    std::vector<std::string> non_comment_lines;
    for (auto &line : lines) {
        StringUtil::TrimWhite(&line);
        if (not line.empty() and line[0] != '#')
            non_comment_lines.emplace_back(line);
    }

    return non_comment_lines;
}


} // unnamed namespace


StopWordSet GetStopWords() {
    StopWordSet stop_words;
    for (const auto stop_word : STOP_WORDS)
        stop_words.emplace(stop_word);

    return stop_words;
}


std::vector<std::string> GetAcademicLexicon() {
    return std::vector<std::string>(std::begin(ACADEMIC_LEXICON), std::end(ACADEMIC_LEXICON));
}


SegmentationDictionary GetSegmentationDictionary() {
    SegmentationDictionary dictionary;
    for (const auto &entry : DICTIONARY_ENTRIES)
        dictionary[entry.word_] = entry.frequency_;

    return dictionary;
}


SegmentationDictionary LoadSegmentationDictionary(const std::string &path) {
    SegmentationDictionary dictionary;
    for (const auto &line : ReadNonCommentLines(path, "LoadSegmentationDictionary")) {
        std::vector<std::string> fields;
        StringUtil::Split(line, ' ', &fields);
        // The optional third field is a part-of-speech tag which we don't need.
        if (fields.size() > 3)
            throw std::runtime_error("in PaperCheckerDefaults::LoadSegmentationDictionary: garbled line \"" + line + "\" in \""
                                     + path + "\"!");

        unsigned frequency(1);
        if (fields.size() >= 2 and not StringUtil::ToUnsigned(fields[1], &frequency))
            throw std::runtime_error("in PaperCheckerDefaults::LoadSegmentationDictionary: bad frequency \"" + fields[1]
                                     + "\" in \"" + path + "\"!");
        dictionary[fields[0]] = frequency;
    }

    return dictionary;
}


std::vector<std::string> LoadWordList(const std::string &path) {
    return ReadNonCommentLines(path, "LoadWordList");
}


} // namespace PaperCheckerDefaults
