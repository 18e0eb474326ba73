#include "docsort/pipeline/orchestrator.hpp"
#include "docsort/events/components.hpp"
#include "docsort/snapshot/rollback_service.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using docsort::ErrorCode;
using docsort::classify::ClassificationResult;
using docsort::documents::BatchStatus;
using docsort::documents::DocumentStatus;
using docsort::documents::DocumentStore;
using docsort::documents::LocalObjectStorage;
using docsort::pipeline::DocumentProcessingOrchestrator;
using docsort::pipeline::ProcessingStatus;
using docsort::review::ReviewStore;
using docsort::snapshot::SnapshotManager;
using docsort::testing::create_temp_dir;
using docsort::testing::read_file;
using docsort::testing::set_mtime;
using docsort::testing::write_file;

namespace {

constexpr long long kMid2023 = 1688212800;

class FixedClassifier : public docsort::classify::Classifier {
public:
    explicit FixedClassifier(ClassificationResult result) : result_(std::move(result)) {}

    docsort::Result<ClassificationResult> classify(std::string_view, const std::string&) override {
        return docsort::Ok(result_);
    }

private:
    ClassificationResult result_;
};

class FailingClassifier : public docsort::classify::Classifier {
public:
    docsort::Result<ClassificationResult> classify(std::string_view, const std::string&) override {
        return docsort::Err<ClassificationResult>(ErrorCode::Internal, "model offline");
    }
};

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("docsort_pipeline_test");
        inbox_ = root_ / "inbox";
        config_.central_base = root_ / "sorted";
        config_.data_dir = root_ / "state";
        config_.processing.backup_dir = root_ / "backups";
        config_.processing.category_paths = docsort::config::default_category_paths();
        config_.processing.workers = 3;

        documents_ = DocumentStore::open(config_.data_dir).value();
        reviews_ = ReviewStore::open(config_, &bus_, documents_.get()).value();
        snapshots_ = SnapshotManager::open(config_.data_dir, *documents_, storage_, &bus_).value();
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    std::unique_ptr<DocumentProcessingOrchestrator> make(std::shared_ptr<docsort::classify::Classifier> model = nullptr) {
        return std::make_unique<DocumentProcessingOrchestrator>(config_, *documents_, storage_, *reviews_,
                                                                snapshots_.get(), std::move(model), &bus_);
    }

    fs::path seed(const fs::path& relative, const std::string& content) {
        const auto path = inbox_ / relative;
        write_file(path, content);
        set_mtime(path, kMid2023);
        return path;
    }

    fs::path root_;
    fs::path inbox_;
    docsort::config::Config config_;
    docsort::events::EventBus bus_;
    LocalObjectStorage storage_;
    std::unique_ptr<DocumentStore> documents_;
    std::unique_ptr<ReviewStore> reviews_;
    std::unique_ptr<SnapshotManager> snapshots_;
};

} // namespace

TEST_F(OrchestratorTest, ConfidentFileIsMovedRecordedAndSnapshotted) {
    docsort::events::MetricsComponent metrics(bus_);
    const auto source = seed(fs::path("12345_Acme") / "invoice.txt", "Rechnung Nr. 7, Betrag 120 EUR");
    auto orchestrator = make();

    auto result = orchestrator->process_file(source);
    ASSERT_EQ(result.status, ProcessingStatus::Processed) << result.message;
    const auto expected = config_.central_base / "12345_Acme" / "Finanzen" / "2023" / "invoice.txt";
    ASSERT_TRUE(result.target_path.has_value());
    EXPECT_EQ(*result.target_path, expected);
    EXPECT_FALSE(fs::exists(source));
    EXPECT_EQ(read_file(expected), "Rechnung Nr. 7, Betrag 120 EUR");

    ASSERT_TRUE(result.backup_path.has_value());
    EXPECT_EQ(result.backup_path->parent_path(), config_.processing.backup_dir);
    EXPECT_EQ(read_file(*result.backup_path), "Rechnung Nr. 7, Betrag 120 EUR");

    auto record = documents_->get(result.document_id).value();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, DocumentStatus::Processed);
    EXPECT_EQ(record->category, "finanzen");
    EXPECT_EQ(record->target_path, expected);
    EXPECT_EQ(record->original_path, source);

    ASSERT_TRUE(result.snapshot_id.has_value());
    auto snapshot = snapshots_->get_snapshot(*result.snapshot_id);
    ASSERT_TRUE(snapshot.is_ok());
    EXPECT_FALSE(snapshot.value().database_state.at(result.document_id).existed);
    EXPECT_EQ(snapshot.value().target_paths.at(result.document_id), expected.string());

    EXPECT_EQ(metrics.get_stats().documents_processed.load(), 1u);
}

TEST_F(OrchestratorTest, RollbackUndoesProcessing) {
    const auto source = seed(fs::path("12345_Acme") / "invoice.txt", "invoice total 99");
    auto orchestrator = make();
    auto result = orchestrator->process_file(source);
    ASSERT_EQ(result.status, ProcessingStatus::Processed) << result.message;

    docsort::snapshot::RollbackService rollback(*snapshots_, *documents_, storage_);
    auto undone = rollback.rollback(*result.snapshot_id);
    EXPECT_TRUE(undone.success) << undone.message;
    EXPECT_TRUE(fs::exists(source));
    EXPECT_FALSE(fs::exists(*result.target_path));
    EXPECT_FALSE(documents_->get(result.document_id).value().has_value());
}

TEST_F(OrchestratorTest, KnownContentIsDuplicate) {
    auto orchestrator = make();
    const auto first = seed("invoice.txt", "invoice 1");
    auto processed = orchestrator->process_file(first);
    ASSERT_EQ(processed.status, ProcessingStatus::Processed);

    const auto second = seed(fs::path("copies") / "invoice_again.txt", "invoice 1");
    auto duplicate = orchestrator->process_file(second);
    EXPECT_EQ(duplicate.status, ProcessingStatus::Duplicate);
    EXPECT_EQ(duplicate.document_id, processed.document_id);
    EXPECT_EQ(duplicate.message, "duplicate of " + processed.target_path->string());
    EXPECT_TRUE(fs::exists(second));
    EXPECT_FALSE(duplicate.snapshot_id.has_value());
}

TEST_F(OrchestratorTest, LowConfidenceGoesToReview) {
    auto orchestrator = make();
    const auto source = seed("notes.txt", "lorem ipsum dolor");

    auto result = orchestrator->process_file(source);
    EXPECT_EQ(result.status, ProcessingStatus::Review);
    ASSERT_TRUE(result.review_id.has_value());
    EXPECT_FALSE(result.target_path.has_value());
    EXPECT_FALSE(result.snapshot_id.has_value());
    EXPECT_TRUE(fs::exists(source));

    auto item = reviews_->get(*result.review_id);
    ASSERT_TRUE(item.is_ok());
    EXPECT_EQ(item.value().suggested_category, "unsorted");
    EXPECT_EQ(item.value().original_path, source);

    auto record = documents_->get(result.document_id).value();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, DocumentStatus::Review);
    EXPECT_TRUE(snapshots_->list_snapshots().value().empty());
}

TEST_F(OrchestratorTest, ConfirmedReviewUpdatesDocumentRecord) {
    auto orchestrator = make();
    const auto source = seed("notes.txt", "lorem ipsum dolor");
    auto queued = orchestrator->process_file(source);
    ASSERT_EQ(queued.status, ProcessingStatus::Review);

    auto confirmed = reviews_->confirm(*queued.review_id, "finanzen");
    ASSERT_TRUE(confirmed.is_ok()) << confirmed.error().message;

    auto record = documents_->get(queued.document_id).value();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, DocumentStatus::Processed);
    EXPECT_EQ(record->category, "finanzen");
    EXPECT_EQ(record->target_path, confirmed.value());
    EXPECT_EQ(record->original_path, source);

    const auto again = seed("notes_again.txt", "lorem ipsum dolor");
    auto duplicate = orchestrator->process_file(again);
    EXPECT_EQ(duplicate.status, ProcessingStatus::Duplicate);
    EXPECT_EQ(duplicate.message, "duplicate of " + confirmed.value().string());
}

TEST_F(OrchestratorTest, DotSegmentsFromModelStayUnderCentralBase) {
    ClassificationResult fixed;
    fixed.category = "projekte";
    fixed.confidence = 0.9;
    fixed.customer = "..";
    fixed.project = ".";
    auto orchestrator = make(std::make_shared<FixedClassifier>(fixed));

    const auto source = seed("plan.txt", "anything");
    auto result = orchestrator->process_file(source);
    ASSERT_EQ(result.status, ProcessingStatus::Processed) << result.message;
    EXPECT_EQ(*result.target_path, config_.central_base / "_" / "Projekte" / "_" / "2023" / "plan.txt");
}

TEST_F(OrchestratorTest, TemplateLeavingCentralBaseFails) {
    config_.processing.category_paths["finanzen"] = "../escape/{year}";
    ClassificationResult fixed;
    fixed.category = "finanzen";
    fixed.confidence = 0.9;
    auto orchestrator = make(std::make_shared<FixedClassifier>(fixed));

    const auto source = seed("invoice.txt", "invoice");
    auto result = orchestrator->process_file(source);
    EXPECT_EQ(result.status, ProcessingStatus::Failed);
    EXPECT_NE(result.message.find("outside"), std::string::npos) << result.message;
    EXPECT_TRUE(fs::exists(source));
    EXPECT_FALSE(fs::exists(root_ / "escape"));
    EXPECT_FALSE(documents_->get(result.document_id).value().has_value());
}

TEST_F(OrchestratorTest, ModelResultDrivesTemplate) {
    ClassificationResult fixed;
    fixed.category = "projekte";
    fixed.confidence = 0.9;
    fixed.customer = "Acme/Corp";
    fixed.project = "Alpha";
    auto orchestrator = make(std::make_shared<FixedClassifier>(fixed));

    const auto source = seed("plan.txt", "anything");
    auto result = orchestrator->process_file(source);
    ASSERT_EQ(result.status, ProcessingStatus::Processed) << result.message;
    EXPECT_EQ(*result.target_path, config_.central_base / "Acme_Corp" / "Projekte" / "Alpha" / "2023" / "plan.txt");
    EXPECT_EQ(result.classification.source, "model");
}

TEST_F(OrchestratorTest, ModelFailureFallsBackToKeywords) {
    auto orchestrator = make(std::make_shared<FailingClassifier>());
    const auto source = seed("payslip.txt", "Gehalt Mai");

    auto result = orchestrator->process_file(source);
    ASSERT_EQ(result.status, ProcessingStatus::Processed) << result.message;
    EXPECT_EQ(result.classification.source, "keywords");
    EXPECT_EQ(result.classification.category, "personal");
    EXPECT_EQ(*result.target_path, config_.central_base / "ALLGEMEIN" / "Personal" / "2023" / "payslip.txt");
}

TEST_F(OrchestratorTest, SnapshotsCanBeDisabled) {
    config_.snapshots.enabled = false;
    config_.processing.backup_enabled = false;
    auto orchestrator = make();
    const auto source = seed("invoice.txt", "invoice");

    auto result = orchestrator->process_file(source);
    ASSERT_EQ(result.status, ProcessingStatus::Processed) << result.message;
    EXPECT_FALSE(result.snapshot_id.has_value());
    EXPECT_FALSE(result.backup_path.has_value());
    EXPECT_TRUE(snapshots_->list_snapshots().value().empty());
}

TEST_F(OrchestratorTest, MissingFileFails) {
    auto orchestrator = make();
    auto result = orchestrator->process_file(inbox_ / "nope.txt");
    EXPECT_EQ(result.status, ProcessingStatus::Failed);
    EXPECT_FALSE(result.message.empty());
}

TEST_F(OrchestratorTest, BatchProcessesMixedInputs) {
    docsort::events::MetricsComponent metrics(bus_);
    const auto a = seed(fs::path("12345_Acme") / "a_invoice.txt", "Rechnung A");
    const auto b = seed(fs::path("12345_Acme") / "b_copy.txt", "Rechnung A");
    const auto c = seed("c_notes.txt", "lorem ipsum");
    const auto d = seed(fs::path("12345_Acme") / "d_video.txt", "footage day one");
    auto orchestrator = make();

    auto batch = orchestrator->process_batch({a, b, c, d});
    ASSERT_TRUE(batch.is_ok());
    const auto& out = batch.value();

    ASSERT_EQ(out.results.size(), 4u);
    EXPECT_EQ(out.results[0].status, ProcessingStatus::Processed);
    EXPECT_EQ(out.results[1].status, ProcessingStatus::Duplicate);
    EXPECT_EQ(out.results[1].message, "duplicate of " + a.string());
    EXPECT_EQ(out.results[2].status, ProcessingStatus::Review);
    EXPECT_EQ(out.results[3].status, ProcessingStatus::Processed);
    EXPECT_EQ(*out.results[3].target_path, config_.central_base / "12345_Acme" / "Footage" / "Allgemein" / "d_video.txt");

    EXPECT_EQ(out.batch.status, BatchStatus::Completed);
    EXPECT_EQ(out.batch.total_files, 4u);
    EXPECT_EQ(out.batch.processed_files, 4u);
    EXPECT_EQ(out.batch.failed_files, 0u);
    EXPECT_TRUE(out.batch.completed_at.has_value());

    auto stored = documents_->get_batch(out.batch.id).value();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, BatchStatus::Completed);

    ASSERT_TRUE(out.snapshot_id.has_value());
    auto snapshot = snapshots_->get_snapshot(*out.snapshot_id).value();
    EXPECT_EQ(snapshot.file_ids.size(), 2u);
    EXPECT_EQ(snapshot.batch_id, std::optional<std::string>(out.batch.id));
    EXPECT_EQ(snapshots_->list_snapshots().value().size(), 1u);

    EXPECT_EQ(metrics.get_stats().documents_processed.load(), 4u);
}

TEST_F(OrchestratorTest, BatchRollbackRestoresEveryMove) {
    const auto a = seed("a_invoice.txt", "Rechnung A");
    const auto b = seed("b_invoice.txt", "Rechnung B");
    auto orchestrator = make();

    auto batch = orchestrator->process_batch({a, b});
    ASSERT_TRUE(batch.is_ok());
    ASSERT_TRUE(batch.value().snapshot_id.has_value());

    docsort::snapshot::RollbackService rollback(*snapshots_, *documents_, storage_);
    auto undone = rollback.rollback(*batch.value().snapshot_id);
    EXPECT_TRUE(undone.success) << undone.message;
    EXPECT_EQ(undone.files_restored, 2u);
    EXPECT_TRUE(fs::exists(a));
    EXPECT_TRUE(fs::exists(b));

    auto restored = documents_->get_batch(batch.value().batch.id).value();
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->status, BatchStatus::Running);
    EXPECT_EQ(restored->processed_files, 0u);
}

TEST_F(OrchestratorTest, BatchCountsFailures) {
    const auto a = seed("a_invoice.txt", "Rechnung A");
    auto orchestrator = make();

    auto batch = orchestrator->process_batch({a, inbox_ / "missing.txt"});
    ASSERT_TRUE(batch.is_ok());
    EXPECT_EQ(batch.value().results[1].status, ProcessingStatus::Failed);
    EXPECT_EQ(batch.value().batch.status, BatchStatus::CompletedWithErrors);
    EXPECT_EQ(batch.value().batch.processed_files, 1u);
    EXPECT_EQ(batch.value().batch.failed_files, 1u);
}

TEST_F(OrchestratorTest, SameNameInOneBatchGetsDistinctTargets) {
    const auto a = seed(fs::path("x") / "invoice.txt", "Rechnung X");
    const auto b = seed(fs::path("y") / "invoice.txt", "Rechnung Y");
    auto orchestrator = make();

    auto batch = orchestrator->process_batch({a, b});
    ASSERT_TRUE(batch.is_ok());
    const auto& results = batch.value().results;
    ASSERT_EQ(results[0].status, ProcessingStatus::Processed);
    ASSERT_EQ(results[1].status, ProcessingStatus::Processed);
    EXPECT_NE(*results[0].target_path, *results[1].target_path);
    EXPECT_EQ(results[1].target_path->filename(), "invoice_1.txt");
}
