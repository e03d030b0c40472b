#include <docket/abi/type_parser.hpp>
#include <docket/registry/builtin_contracts.hpp>

#include <spdlog/spdlog.h>

#include <string_view>
#include <vector>

namespace docket::registry {

namespace {

struct builtin_function final {
  std::string_view fragment;
  std::string_view selector;
  std::string_view description;
};

struct builtin_contract final {
  std::string_view address;
  std::string_view name;
  std::string_view description;
  schema::contract_category category;
  schema::action_category domain;
  std::vector<builtin_function> functions;
};

std::vector<builtin_contract> make_table() {
  return {
    builtin_contract{
        .address = "0x9c8ff314c9bc7f6e59a9d9225fb22946427edc03",
        .name = "Nouns Token",
        .description = "ERC-721 token contract for Nouns NFTs with delegation",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::token,
        .functions = {
            {"function transferFrom(address from, address to, uint256 tokenId)",
             "23b872dd", "Transfer a Noun to another account"},
            {"function safeTransferFrom(address from, address to, uint256 tokenId)",
             "42842e0e", "Safely transfer a Noun to another account"},
            {"function approve(address to, uint256 tokenId)",
             "095ea7b3", "Approve an account to transfer a Noun"},
            {"function setApprovalForAll(address operator, bool approved)",
             "a22cb465", "Grant or revoke an operator for all Nouns"},
            {"function delegate(address delegatee)",
             "5c19a95c", "Delegate Noun voting power"},
            {"function delegateBySig(address delegatee, uint256 nonce, uint256 expiry, uint8 v, bytes32 r, bytes32 s)",
             "c3cda520", "Delegate voting power with a signature"},
            {"function mint()",
             "1249c58b", "Mint a new Noun to the minter"},
            {"function burn(uint256 nounId)",
             "42966c68", "Burn a Noun"},
            {"function setMinter(address _minter)",
             "fca3b5aa", "Set the minter address"},
            {"function lockMinter()",
             "76daebe1", "Permanently lock the minter"},
            {"function setDescriptor(address _descriptor)",
             "01b9a397", "Set the artwork descriptor"},
            {"function lockDescriptor()",
             "41b5d0de", "Permanently lock the descriptor"},
            {"function setSeeder(address _seeder)",
             "d50b31eb", "Set the trait seeder"},
            {"function lockSeeder()",
             "5f295a67", "Permanently lock the seeder"},
            {"function setNoundersDAO(address _noundersDAO)",
             "058df0ab", "Set the Nounders DAO address"},
            {"function setContractURIHash(string newContractURIHash)",
             "baedc1c4", "Set the contract metadata hash"},
            {"function transferOwnership(address newOwner)",
             "f2fde38b", "Transfer contract ownership"},
            {"function renounceOwnership()",
             "715018a6", "Renounce contract ownership"},
        },
    },
    builtin_contract{
        .address = "0x830bd73e4184cef73443c15111a1df14e495c706",
        .name = "Nouns Auction House",
        .description = "Daily auction house for Nouns",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::auction,
        .functions = {
            {"function settleCurrentAndCreateNewAuction()",
             "f25efffc", "Settle the current auction and start the next"},
            {"function settleAuction()",
             "a4d0a17e", "Settle the current auction"},
            {"function createBid(uint256 nounId)",
             "659dd2b4", "Bid on a Noun"},
            {"function createBid(uint256 nounId, uint32 clientId)",
             "abbfb786", "Bid on a Noun through a client"},
            {"function pause()",
             "8456cb59", "Pause the auction house"},
            {"function unpause()",
             "3f4ba83a", "Unpause the auction house"},
            {"function setTimeBuffer(uint56 _timeBuffer)",
             "0ba4e9ea", "Set the auction time buffer"},
            {"function setReservePrice(uint192 _reservePrice)",
             "c0555d98", "Set the auction reserve price"},
            {"function setMinBidIncrementPercentage(uint8 _minBidIncrementPercentage)",
             "36ebdb38", "Set the minimum bid increment"},
            {"function transferOwnership(address newOwner)",
             "f2fde38b", "Transfer contract ownership"},
            {"function renounceOwnership()",
             "715018a6", "Renounce contract ownership"},
        },
    },
    builtin_contract{
        .address = "0xb1a32fc9f9d8b2cf86c068cae13108809547ef71",
        .name = "Nouns Treasury",
        .description = "Main treasury (Executor/Timelock)",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::treasury,
        .functions = {
            {"function sendETH(address recipient, uint256 ethToSend)",
             "64a197f3", "Send ETH from the treasury"},
            {"function sendERC20(address recipient, address erc20Token, uint256 tokensToSend)",
             "8f975a64", "Send ERC-20 tokens from the treasury"},
            {"function acceptAdmin()",
             "0e18b681", "Accept the treasury admin role"},
            {"function setPendingAdmin(address pendingAdmin_)",
             "4dd18bf5", "Propose a new treasury admin"},
            {"function setDelay(uint256 delay_)",
             "e177246e", "Set the timelock delay"},
            {"function upgradeTo(address newImplementation)",
             "3659cfe6", "Upgrade the treasury implementation"},
            {"function upgradeToAndCall(address newImplementation, bytes data)",
             "4f1ef286", "Upgrade the treasury implementation and initialize it"},
            {"function queueTransaction(address target, uint256 value, string signature, bytes data, uint256 eta)",
             "3a66f901", "Queue a timelock transaction"},
            {"function cancelTransaction(address target, uint256 value, string signature, bytes data, uint256 eta)",
             "591fcdfe", "Cancel a queued timelock transaction"},
            {"function executeTransaction(address target, uint256 value, string signature, bytes data, uint256 eta)",
             "0825f38f", "Execute a queued timelock transaction"},
        },
    },
    builtin_contract{
        .address = "0x6f3e6272a167e8accb32072d08e0957f9c79223d",
        .name = "Nouns DAO Proxy",
        .description = "DAO Governor for proposing and voting",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::governance_admin,
        .functions = {
            {"function _setVotingDelay(uint256 newVotingDelay)",
             "1dfb1b5a", "Set the voting delay in blocks"},
            {"function _setVotingPeriod(uint256 newVotingPeriod)",
             "0ea2d98c", "Set the voting period in blocks"},
            {"function _setProposalThresholdBPS(uint256 newProposalThresholdBPS)",
             "97d048e5", "Set the proposal threshold"},
            {"function _setObjectionPeriodDurationInBlocks(uint32 newObjectionPeriodDurationInBlocks)",
             "e5eb5abf", "Set the objection period duration"},
            {"function _setLastMinuteWindowInBlocks(uint32 newLastMinuteWindowInBlocks)",
             "e2560772", "Set the last minute window"},
            {"function _setProposalUpdatablePeriodInBlocks(uint32 newProposalUpdatablePeriodInBlocks)",
             "74b157b8", "Set the proposal updatable period"},
            {"function _setMinQuorumVotesBPS(uint16 newMinQuorumVotesBPS)",
             "7a3da691", "Set the minimum quorum"},
            {"function _setMaxQuorumVotesBPS(uint16 newMaxQuorumVotesBPS)",
             "50196db3", "Set the maximum quorum"},
            {"function _setQuorumCoefficient(uint32 newQuorumCoefficient)",
             "2b5ca189", "Set the dynamic quorum coefficient"},
            {"function _setDynamicQuorumParams(uint16 newMinQuorumVotesBPS, uint16 newMaxQuorumVotesBPS, uint32 newQuorumCoefficient)",
             "ec91deda", "Set the dynamic quorum parameters"},
            {"function _setPendingAdmin(address newPendingAdmin)",
             "b71d1a0c", "Propose a new DAO admin"},
            {"function _acceptAdmin()",
             "e9c714f2", "Accept the DAO admin role"},
            {"function _setPendingVetoer(address newPendingVetoer)",
             "d3f662e1", "Propose a new vetoer"},
            {"function _burnVetoPower()",
             "bf7a2963", "Permanently remove the veto power"},
            {"function _withdraw()",
             "c10eb14d", "Withdraw ETH held by the DAO"},
            {"function _setForkPeriod(uint256 newForkPeriod)",
             "842e4dae", "Set the fork period"},
            {"function _setForkThresholdBPS(uint256 newForkThresholdBPS)",
             "06ef9d36", "Set the fork threshold"},
            {"function _setForkEscrow(address newForkEscrow)",
             "2df01bdb", "Set the fork escrow contract"},
            {"function _setForkDAODeployer(address newForkDAODeployer)",
             "f5f4714c", "Set the fork DAO deployer"},
            {"function _setErc20TokensToIncludeInFork(address[] erc20tokens)",
             "a78b5f1a", "Set the ERC-20 tokens shared with forks"},
            {"function _setTimelocksAndAdmin(address newTimelock, address newTimelockV1, address newAdmin)",
             "44697f98", "Set the timelocks and the admin"},
        },
    },
    builtin_contract{
        .address = "0xf790a5f59678dd733fb3de93493a91f472ca1365",
        .name = "Nouns DAO Data Proxy",
        .description = "Data proxy for candidates and feedback",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::governance_admin,
        .functions = {
            {"function setCreateCandidateCost(uint256 newCreateCandidateCost)",
             "1fdefaab", "Set the cost of creating a candidate"},
            {"function setUpdateCandidateCost(uint256 newUpdateCandidateCost)",
             "06b88d68", "Set the cost of updating a candidate"},
            {"function setFeeRecipient(address payable newFeeRecipient)",
             "e74b981b", "Set the candidate fee recipient"},
            {"function upgradeTo(address newImplementation)",
             "3659cfe6", "Upgrade the data proxy implementation"},
            {"function transferOwnership(address newOwner)",
             "f2fde38b", "Transfer contract ownership"},
            {"function renounceOwnership()",
             "715018a6", "Renounce contract ownership"},
        },
    },
    builtin_contract{
        .address = "0x33a9c445fb4fb21f2c030a6b2d3e2f12d017bfac",
        .name = "Nouns Descriptor V3",
        .description = "Descriptor V3 for traits and artwork generation",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::art,
        .functions = {
            {"function setArtDescriptor(address descriptor)",
             "010ecde7", "Set the art descriptor"},
            {"function setArtInflator(address inflator)",
             "f4513a6a", "Set the art inflator"},
            {"function setRenderer(address _renderer)",
             "56d3163d", "Set the SVG renderer"},
            {"function toggleDataURIEnabled()",
             "dfe8478b", "Toggle on-chain data URIs"},
            {"function setBaseURI(string _baseURI)",
             "55f804b3", "Set the token base URI"},
            {"function lockParts()",
             "2a1d0769", "Permanently lock the art parts"},
            {"function setPalette(uint8 paletteIndex, bytes palette)",
             "e79c9ea6", "Replace a color palette"},
            {"function addBackground(string _background)",
             "5e70664c", "Add a background color"},
            {"function addManyBackgrounds(string[] _backgrounds)",
             "91b7916a", "Add background colors"},
            {"function addBodies(bytes encodedCompressed, uint80 decompressedLength, uint16 imageCount)",
             "aa5bf7d8", "Add body traits"},
            {"function addAccessories(bytes encodedCompressed, uint80 decompressedLength, uint16 imageCount)",
             "0ba3db1a", "Add accessory traits"},
            {"function addHeads(bytes encodedCompressed, uint80 decompressedLength, uint16 imageCount)",
             "94f3df61", "Add head traits"},
            {"function addGlasses(bytes encodedCompressed, uint80 decompressedLength, uint16 imageCount)",
             "353c36a0", "Add glasses traits"},
            {"function transferOwnership(address newOwner)",
             "f2fde38b", "Transfer contract ownership"},
            {"function renounceOwnership()",
             "715018a6", "Renounce contract ownership"},
        },
    },
    builtin_contract{
        .address = "0xcc8a0fb5ab3c7132c1b2a0109142fb112c4ce515",
        .name = "Nouns Seeder",
        .description = "Generates pseudorandom trait seeds for Nouns",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::art,
        .functions = {},
    },
    builtin_contract{
        .address = "0x883860178f95d0c82413edc1d6de530cb4771d55",
        .name = "Client Rewards Proxy",
        .description = "Client rewards for proposal creation and voting",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::rewards,
        .functions = {
            {"function registerClient(string name, string description)",
             "4364d973", "Register a client"},
            {"function setClientApproval(uint32 clientId, bool approved)",
             "ac4951f6", "Approve or revoke a client"},
            {"function updateRewardsForAuctions(uint32 lastNounId)",
             "4818ac42", "Distribute auction rewards"},
            {"function updateRewardsForProposalWritingAndVoting(uint32 lastProposalId, uint32[] votingClientIds)",
             "cc9df021", "Distribute proposal and voting rewards"},
            {"function withdrawClientBalance(uint32 clientId, address to, uint256 amount)",
             "e3ccce50", "Withdraw a client reward balance"},
            {"function setAdmin(address newAdmin)",
             "704b6c02", "Set the rewards admin"},
            {"function setProposalRewardParams(tuple(uint32 minimumRewardPeriod, uint8 numProposalsEnoughForReward, uint16 proposalRewardBps, uint16 votingRewardBps, uint16 proposalEligibilityQuorumBps) newParams)",
             "4fc8d76a", "Set the proposal reward parameters"},
            {"function enableProposalRewards()",
             "0553d778", "Enable proposal rewards"},
            {"function disableProposalRewards()",
             "bce7f0da", "Disable proposal rewards"},
            {"function enableAuctionRewards()",
             "d0e1a846", "Enable auction rewards"},
            {"function disableAuctionRewards()",
             "8d976323", "Disable auction rewards"},
            {"function pause()",
             "8456cb59", "Pause client rewards"},
            {"function unpause()",
             "3f4ba83a", "Unpause client rewards"},
            {"function upgradeTo(address newImplementation)",
             "3659cfe6", "Upgrade the rewards implementation"},
            {"function transferOwnership(address newOwner)",
             "f2fde38b", "Transfer contract ownership"},
            {"function renounceOwnership()",
             "715018a6", "Renounce contract ownership"},
        },
    },
    builtin_contract{
        .address = "0x4f2acdc74f6941390d9b1804fabc3e780388cfe5",
        .name = "Token Buyer",
        .description = "Converts ETH to USDC for payments",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::treasury,
        .functions = {
            {"function buyETH(uint256 tokenAmount)",
             "efbf8185", "Buy ETH with USDC from treasury"},
            {"function buyETH(uint256 tokenAmount, address to, bytes data)",
             "cbe49af7", "Buy ETH with USDC and forward it"},
            {"function pause()",
             "8456cb59", "Pause the token buyer"},
            {"function unpause()",
             "3f4ba83a", "Unpause the token buyer"},
            {"function setAdmin(address newAdmin)",
             "704b6c02", "Set the token buyer admin"},
            {"function setBaselinePaymentTokenAmount(uint256 newBaselinePaymentTokenAmount)",
             "41fbc645", "Set the baseline USDC amount"},
            {"function setBotDiscountBPs(uint16 newBotDiscountBPs)",
             "2cf9e526", "Set the bot discount"},
            {"function setPayer(address newPayer)",
             "d55e6975", "Set Payer contract address"},
            {"function setPriceFeed(address newPriceFeed)",
             "724e78da", "Set price feed oracle address"},
            {"function withdrawETH()",
             "e086e5ec", "Withdraw ETH from Token Buyer"},
            {"function transferOwnership(address newOwner)",
             "f2fde38b", "Transfer contract ownership"},
            {"function renounceOwnership()",
             "715018a6", "Renounce contract ownership"},
        },
    },
    builtin_contract{
        .address = "0xd97bcd9f47cee35c0a9ec1dc40c1269afc9e8e1d",
        .name = "Payer",
        .description = "Handles USDC payments from treasury",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::treasury,
        .functions = {
            {"function sendOrRegisterDebt(address account, uint256 amount)",
             "4223a5bb", "Send USDC or register debt if insufficient balance"},
            {"function payBackDebt(uint256 amount)",
             "842a3136", "Pay back registered debt"},
            {"function withdrawPaymentToken()",
             "a07a2ee7", "Withdraw USDC held by the Payer"},
            {"function transferOwnership(address newOwner)",
             "f2fde38b", "Transfer contract ownership"},
            {"function renounceOwnership()",
             "715018a6", "Renounce contract ownership"},
        },
    },
    builtin_contract{
        .address = "0x0fd206fc7a7dbcd5661157edcb1ffdd0d02a61ff",
        .name = "Stream Factory",
        .description = "Factory for creating payment streams",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::stream,
        .functions = {
            {"function createStream(address recipient, uint256 tokenAmount, address tokenAddress, uint256 startTime, uint256 stopTime)",
             "cc1b4bf6", "Create a payment stream"},
            {"function createStream(address recipient, uint256 tokenAmount, address tokenAddress, uint256 startTime, uint256 stopTime, uint8 nonce, address predictedStreamAddress)",
             "410aa522", "Create a payment stream at a predicted address"},
            {"function createStream(address payer, address recipient, uint256 tokenAmount, address tokenAddress, uint256 startTime, uint256 stopTime, uint8 nonce)",
             "34fa9969", "Create a payment stream for a payer"},
            {"function createStream(address payer, address recipient, uint256 tokenAmount, address tokenAddress, uint256 startTime, uint256 stopTime, uint8 nonce, address msgSender, address predictedStreamAddress)",
             "f95dcbda", "Create a payment stream for a payer at a predicted address"},
            {"function createAndFundStream(address recipient, uint256 tokenAmount, address tokenAddress, uint256 startTime, uint256 stopTime)",
             "11a125ab", "Create and fund a payment stream"},
        },
    },
    builtin_contract{
        .address = "0x0bc3807ec262cb779b38d65b38158acc3bfede10",
        .name = "Nouns Treasury V1",
        .description = "Legacy treasury V1",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::treasury,
        .functions = {
            {"function acceptAdmin()",
             "0e18b681", "Accept the treasury admin role"},
            {"function setPendingAdmin(address pendingAdmin_)",
             "4dd18bf5", "Propose a new treasury admin"},
            {"function setDelay(uint256 delay_)",
             "e177246e", "Set the timelock delay"},
            {"function queueTransaction(address target, uint256 value, string signature, bytes data, uint256 eta)",
             "3a66f901", "Queue a timelock transaction"},
            {"function cancelTransaction(address target, uint256 value, string signature, bytes data, uint256 eta)",
             "591fcdfe", "Cancel a queued timelock transaction"},
            {"function executeTransaction(address target, uint256 value, string signature, bytes data, uint256 eta)",
             "0825f38f", "Execute a queued timelock transaction"},
        },
    },
    builtin_contract{
        .address = "0x44d97d22b3d37d837ce4b22773aad9d1566055d9",
        .name = "Fork Escrow",
        .description = "Escrow for DAO fork mechanism",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::governance_admin,
        .functions = {
            {"function closeEscrow()",
             "c163de3d", "Close the fork escrow"},
            {"function returnTokensToOwner(address owner, uint256[] tokenIds)",
             "6acff27a", "Return escrowed Nouns to their owner"},
            {"function withdrawTokens(uint256[] tokenIds, address to)",
             "d07d804c", "Withdraw escrowed Nouns"},
        },
    },
    builtin_contract{
        .address = "0xcd65e61f70e0b1aa433ca1d9a6fc2332e9e73ce3",
        .name = "Fork DAO Deployer",
        .description = "Deploys new DAO instances for forks",
        .category = schema::contract_category::known_internal,
        .domain = schema::action_category::governance_admin,
        .functions = {
            {"function deployForkDAO(uint256 forkingPeriodEndTimestamp, address forkEscrow)",
             "fb146943", "Deploy a fork DAO"},
        },
    },
    builtin_contract{
        .address = "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2",
        .name = "WETH",
        .description = "Wrapped Ether (used in auctions)",
        .category = schema::contract_category::known_external,
        .domain = schema::action_category::token,
        .functions = {
            {"function transfer(address to, uint256 amount) returns (bool)",
             "a9059cbb", "Transfer tokens"},
            {"function approve(address spender, uint256 amount) returns (bool)",
             "095ea7b3", "Approve a spender"},
            {"function transferFrom(address from, address to, uint256 amount) returns (bool)",
             "23b872dd", "Transfer tokens on behalf of an owner"},
            {"function balanceOf(address account) view returns (uint256)",
             "70a08231", "Token balance of an account"},
            {"function allowance(address owner, address spender) view returns (uint256)",
             "dd62ed3e", "Remaining allowance of a spender"},
            {"function deposit() payable",
             "d0e30db0", "Wrap ETH"},
            {"function withdraw(uint256 wad)",
             "2e1a7d4d", "Unwrap WETH"},
        },
    },
    builtin_contract{
        .address = "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48",
        .name = "USDC",
        .description = "USD Coin (used for payments)",
        .category = schema::contract_category::known_external,
        .domain = schema::action_category::token,
        .functions = {
            {"function transfer(address to, uint256 amount) returns (bool)",
             "a9059cbb", "Transfer tokens"},
            {"function approve(address spender, uint256 amount) returns (bool)",
             "095ea7b3", "Approve a spender"},
            {"function transferFrom(address from, address to, uint256 amount) returns (bool)",
             "23b872dd", "Transfer tokens on behalf of an owner"},
            {"function balanceOf(address account) view returns (uint256)",
             "70a08231", "Token balance of an account"},
            {"function allowance(address owner, address spender) view returns (uint256)",
             "dd62ed3e", "Remaining allowance of a spender"},
        },
    },
    builtin_contract{
        .address = "0x57f1887a8bf19b14fc0df6fd9b2acc9af147ea85",
        .name = "ENS",
        .description = "Ethereum Name Service",
        .category = schema::contract_category::known_external,
        .domain = schema::action_category::unknown,
        .functions = {},
    },
  };
}

}  // namespace

std::vector<schema::contract_schema_entry> builtin_contracts() {
  auto out = std::vector<schema::contract_schema_entry>{};
  for (const auto& contract : make_table()) {
    auto entry = schema::contract_schema_entry{
        .address = std::string{contract.address},
        .display_name = std::string{contract.name},
        .description = std::string{contract.description},
        .category = contract.category,
        .domain = contract.domain,
        .builtin = true,
    };
    for (const auto& function : contract.functions) {
      auto parsed = abi::parse_function(function.fragment);
      if (!parsed) {
        spdlog::error("built-in fragment for {} does not parse: {}",
                      contract.name, function.fragment);
        continue;
      }
      parsed->selector = schema::try_make_selector(function.selector);
      parsed->description = std::string{function.description};
      auto signature = parsed->signature;
      entry.functions.insert_or_assign(std::move(signature),
                                       std::move(*parsed));
    }
    out.push_back(std::move(entry));
  }
  return out;
}

}  // namespace docket::registry
