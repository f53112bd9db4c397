#include <gtest/gtest.h>
#include "test_helpers.h"
#include "transfer/transcoder.h"
#include <filesystem>

using xferpress::ShellTranscoder;

TEST(ShellTranscoder, QuotesArguments) {
    EXPECT_EQ(ShellTranscoder::shellQuote("plain"), "'plain'");
    EXPECT_EQ(ShellTranscoder::shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(ShellTranscoder::shellQuote("$(rm -rf /)"), "'$(rm -rf /)'");
}

TEST(ShellTranscoder, RendersTemplate) {
    ShellTranscoder t("ffmpeg -i {input} -crf {crf} {output} # {crf}");
    EXPECT_EQ(t.renderCommand("/tmp/in file.mp4", 23, "/tmp/out.cmp"),
              "ffmpeg -i '/tmp/in file.mp4' -crf 23 '/tmp/out.cmp' # 23");
}

TEST(ShellTranscoder, ReportsCommandExitStatus) {
    auto dir = makeScratchDir("transcoder");
    auto input = dir / "in.mp4";
    auto output = dir / "out.cmp";
    writeFileContents(input, "frames");

    ShellTranscoder copier("cp {input} {output}");
    EXPECT_TRUE(copier.transcode(input, 23, output));
    EXPECT_EQ(readFileContents(output), "frames");

    ShellTranscoder failing("exit 3");
    EXPECT_FALSE(failing.transcode(input, 23, output));

    ShellTranscoder missing("cp {input} {output}");
    EXPECT_FALSE(missing.transcode(dir / "absent.mp4", 23, dir / "never.cmp"));
    std::filesystem::remove_all(dir);
}
