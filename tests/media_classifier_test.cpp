#include <gtest/gtest.h>
#include "test_base.hpp"
#include "core/media_classifier.hpp"
#include <future>

class MediaClassifierTest : public TestBase
{
};

TEST_F(MediaClassifierTest, ConfiguredVideoExtensionsAreVideo)
{
    MediaClassifier classifier(config_);
    for (const auto &ext : config_.video_extensions)
    {
        EXPECT_EQ(classifier.classify(getTestFilesDir() + "/clip." + ext), MediaKind::VIDEO) << ext;
    }
}

TEST_F(MediaClassifierTest, ConfiguredImageExtensionsAreImage)
{
    MediaClassifier classifier(config_);
    for (const auto &ext : config_.image_extensions)
    {
        EXPECT_EQ(classifier.classify(getTestFilesDir() + "/cover." + ext), MediaKind::IMAGE) << ext;
    }
}

TEST_F(MediaClassifierTest, ExtensionIsCaseInsensitive)
{
    MediaClassifier classifier(config_);
    EXPECT_EQ(classifier.classify("/tmp/VIDEO.MP4"), classifier.classify("/tmp/video.mp4"));
    EXPECT_EQ(classifier.classify("/tmp/VIDEO.MP4"), MediaKind::VIDEO);
    EXPECT_EQ(classifier.classify("/tmp/Photo.JpEg"), MediaKind::IMAGE);
}

TEST_F(MediaClassifierTest, UnknownExtensionFallsBackToContent)
{
    std::string path = createFile("picture.bin", pngHeader());

    MediaClassifier classifier(config_);
    EXPECT_EQ(classifier.classifyByExtension(path), MediaKind::UNKNOWN);
    EXPECT_EQ(classifier.classify(path), MediaKind::IMAGE);
}

TEST_F(MediaClassifierTest, ContentWithoutExtensionIsSniffed)
{
    std::string path = createFile("download", pngHeader());

    MediaClassifier classifier(config_);
    EXPECT_EQ(classifier.classify(path), MediaKind::IMAGE);
}

TEST_F(MediaClassifierTest, PlainTextIsUnknown)
{
    std::string path = createFile("notes.dat", "just some words, nothing to see here\n");

    MediaClassifier classifier(config_);
    EXPECT_EQ(classifier.classify(path), MediaKind::UNKNOWN);
}

TEST_F(MediaClassifierTest, MissingOrEmptyFileIsUnknown)
{
    MediaClassifier classifier(config_);
    EXPECT_EQ(classifier.classify(getTestFilesDir() + "/does_not_exist.bin"), MediaKind::UNKNOWN);

    std::string empty = createFile("empty.bin", "");
    EXPECT_EQ(classifier.classify(empty), MediaKind::UNKNOWN);
}

TEST_F(MediaClassifierTest, ExtensionSetsComeFromConfiguration)
{
    config_.video_extensions = {"MP4"};
    config_.image_extensions = {};
    MediaClassifier classifier(config_);

    EXPECT_EQ(classifier.classify("/tmp/a.mp4"), MediaKind::VIDEO);
    EXPECT_EQ(classifier.classifyByExtension("/tmp/a.webm"), MediaKind::UNKNOWN);
    EXPECT_EQ(classifier.classifyByExtension("/tmp/a.jpg"), MediaKind::UNKNOWN);
}

TEST_F(MediaClassifierTest, AsyncMatchesBlocking)
{
    std::string video = createFile("clip.mp4", "not really a video");
    std::string image = createFile("raw_image", pngHeader());

    MediaClassifier classifier(config_);
    auto video_future = classifier.classifyAsync(video);
    auto image_future = classifier.classifyAsync(image);

    EXPECT_EQ(video_future.get(), MediaKind::VIDEO);
    EXPECT_EQ(image_future.get(), MediaKind::IMAGE);
}

TEST_F(MediaClassifierTest, GetFileExtension)
{
    EXPECT_EQ(MediaClassifier::getFileExtension("/tmp/clip.MP4"), "mp4");
    EXPECT_EQ(MediaClassifier::getFileExtension("/tmp/archive.tar.gz"), "gz");
    EXPECT_EQ(MediaClassifier::getFileExtension("/tmp/no_extension"), "");
    EXPECT_EQ(MediaClassifier::getFileExtension("/tmp/dir.with.dots/file"), "");
    EXPECT_EQ(MediaClassifier::getFileExtension("/tmp/trailing."), "");
}

TEST_F(MediaClassifierTest, GetFileExtensionWithNonAsciiNames)
{
    EXPECT_EQ(MediaClassifier::getFileExtension("/tmp/Vid\xC3\xA9o.MP4"), "mp4");
    EXPECT_EQ(MediaClassifier::getFileExtension("/tmp/\xD0\x9A\xD0\xBB\xD0\xB8\xD0\xBF.JPG"), "jpg");
    // Bytes above 0x7F pass through untouched
    EXPECT_EQ(MediaClassifier::getFileExtension("/tmp/clip.\xC3\x89X"), "\xC3\x89x");
}

TEST(MediaKindsTest, MimeTypesMapByTopLevelToken)
{
    EXPECT_EQ(MediaKinds::fromMimeType("video/mp4"), MediaKind::VIDEO);
    EXPECT_EQ(MediaKinds::fromMimeType("image/png"), MediaKind::IMAGE);
    EXPECT_EQ(MediaKinds::fromMimeType("text/plain"), MediaKind::UNKNOWN);
    EXPECT_EQ(MediaKinds::fromMimeType("application/octet-stream"), MediaKind::UNKNOWN);
}

TEST(MediaKindsTest, PreferenceRankOrdersVideoFirst)
{
    EXPECT_LT(MediaKinds::preferenceRank(MediaKind::VIDEO), MediaKinds::preferenceRank(MediaKind::IMAGE));
    EXPECT_LT(MediaKinds::preferenceRank(MediaKind::IMAGE), MediaKinds::preferenceRank(MediaKind::UNKNOWN));
}
